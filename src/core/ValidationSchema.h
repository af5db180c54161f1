#pragma once
#include "Severity.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace skill_scan {

struct ValidatedFinding {
    std::string finding_id;
    bool is_true_positive = false;
    Severity final_severity = Severity::Low;
    std::string reason;
    std::vector<std::string> mitigation;
};

struct ValidatedSecurity {
    std::vector<ValidatedFinding> validated_findings;
    std::string security_summary;
};

// Strict JSON schema handed to the validator as the response format.
const nlohmann::json& validated_security_schema();

// Locates the validator's JSON payload inside a Responses-style envelope:
// output[].content[] of type output_text/text (JSON string) or output_json (object),
// else a top-level output_text string. Throws ValidationError when none is usable.
nlohmann::json extract_payload(const nlohmann::json& envelope);

// Strict check against validated_security_schema(): required keys, types, severity enum,
// no additional properties. Throws ValidationError naming the offending field.
ValidatedSecurity parse_validated_security(const nlohmann::json& payload);

}
