#pragma once
#include "Validator.h"
#include <string>

namespace skill_scan {

struct Config;

struct TransportResult {
    bool ok = false;
    long http_status = 0;
    std::string body;
    std::string error;
    int attempts = 0;
};

// Responses-style HTTP validator over libcurl. Bearer token is read from the environment
// variable named by Config::api_key_env at call time.
class OpenAIClient : public ValidatorClient {
public:
    explicit OpenAIClient(const Config& config);
    nlohmann::json create_response(const ValidatorCall& call) override;

    // Request body for a call; exposed for tests.
    nlohmann::ordered_json build_body(const ValidatorCall& call) const;
    // Bounded attempt loop; transport errors and 5xx/429 are retried while attempts remain.
    TransportResult post(const std::string& body, const std::string& api_key, long timeout_ms) const;

    static constexpr long kMaxBackoffMs = 8000;
    // Sleep before retrying after failed attempt `attempt` (1-based): base * 2^(attempt-1), capped.
    static long backoff_delay_ms(long base_ms, int attempt);
private:
    std::string endpoint_;
    std::string api_key_env_;
    int max_output_tokens_;
    int attempts_;
    long backoff_ms_;
};

// curl_global_init/curl_global_cleanup for the lifetime of main.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

}
