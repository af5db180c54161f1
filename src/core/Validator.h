#pragma once
#include "Escalation.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace skill_scan {

// Any failure on the validation path: transport, timeout, envelope, JSON or schema.
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ValidatorCall {
    ValidatorProfile profile;
    std::string system_instruction;
    nlohmann::ordered_json user_payload;
    const nlohmann::json* schema = nullptr;
    long timeout_ms = 60000;
};

// External judgment service. Implementations return the raw response envelope and throw
// ValidationError on failure.
class ValidatorClient {
public:
    virtual ~ValidatorClient() = default;
    virtual nlohmann::json create_response(const ValidatorCall& call) = 0;
};

}
