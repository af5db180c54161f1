#pragma once
#include <string>
#include <vector>
#include <optional>

namespace skill_scan {

// What happens to a unit of work when escalation was triggered but the validator failed.
enum class ValidationMode {
    Required, // fail the whole unit (default)
    Degrade,  // keep the deterministic result, llm_used=false
    Off       // never call the validator
};

std::string validation_mode_to_string(ValidationMode m);
std::optional<ValidationMode> validation_mode_from_string(const std::string& s);

struct Config {
    std::vector<std::string> artifacts; // artifact directories, positional
    std::string artifacts_file; // newline-delimited artifact directories (comments starting with #)
    std::vector<std::string> enable_scanners; // if non-empty, only these
    std::vector<std::string> disable_scanners;
    std::string output_file;
    std::string fail_on_severity = ""; // exit non-zero if any finding >= this
    bool pretty = false;
    bool compact = false; // wins over pretty
    std::string log_level = "info";

    // Loader
    long long max_file_bytes = 1000000;
    std::vector<std::string> exclude_dirs; // added to the built-in exclusions

    // Validator
    ValidationMode validation_mode = ValidationMode::Required;
    std::string validator_endpoint = "https://api.openai.com/v1/responses";
    std::string api_key_env = "OPENAI_API_KEY";
    std::string default_model = "o4-mini";
    std::string escalated_model = "gpt-5.1";
    std::string escalated_effort = "low";
    long validator_timeout_ms = 60000;
    int validator_attempts = 1; // no automatic retry unless raised explicitly
    long validator_backoff_ms = 500; // first retry delay, doubled per attempt
    int max_output_tokens = 700;

    // Batch
    bool parallel = false;
    int parallel_max_threads = 0; // 0 = hardware concurrency
};

int severity_rank(const std::string& sev); // 0 for empty/unknown, LOW=1 .. CRITICAL=4

}
