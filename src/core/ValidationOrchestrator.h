#pragma once
#include "Scanner.h"
#include "ValidationSchema.h"
#include "Validator.h"
#include <map>
#include <vector>

namespace skill_scan {

struct Config;

struct ContextSnippet {
    std::string file_path;
    std::string snippet;
};

constexpr size_t kMaxContextSnippets = 20;
constexpr size_t kSnippetMaxChars = 600;

extern const char* const kValidatorSystemInstruction;
extern const char* const kValidatorTask;

// One snippet per distinct file referenced by a finding, in file order.
std::vector<ContextSnippet> build_context_snippets(const std::vector<Finding>& findings,
                                                   const std::vector<ScannedFile>& files);

// All four severities present, zero when absent.
std::map<std::string,int> severity_counts(const std::vector<Finding>& findings);

nlohmann::ordered_json build_request_payload(const std::vector<Finding>& findings, int risk_score,
                                             const std::vector<ContextSnippet>& snippets);

class ValidationOrchestrator {
public:
    ValidationOrchestrator(ValidatorClient& client, const Config& config) : client_(client), config_(config) {}

    // Sends the findings for review and returns the validator's verdicts, restricted to the
    // ids that were sent. Throws ValidationError on any failure.
    ValidatedSecurity validate(const std::vector<Finding>& findings, int risk_score,
                               const std::vector<ScannedFile>& files, const ValidatorProfile& profile);
private:
    ValidatorClient& client_;
    const Config& config_;
};

}
