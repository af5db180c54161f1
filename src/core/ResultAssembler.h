#pragma once
#include "Scanner.h"
#include "ValidationSchema.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace skill_scan {

struct SafetyCheck {
    std::string key;
    bool safe = true;
    std::string safe_message;
    std::string risk_message;
    const std::string& statement() const { return safe ? safe_message : risk_message; }
};

struct UserExplanation {
    std::string headline;
    std::string summary;
    std::vector<std::string> top_concerns;
    std::vector<std::string> recommended_actions;
    std::vector<SafetyCheck> safety_checks;
    std::vector<std::string> safety_statements;
};

// Final per-artifact record. overall_score and content_hash travel beside the security
// payload for persistence; they are not part of it.
struct AnalysisRecord {
    std::vector<Finding> findings;
    std::vector<ValidatedFinding> validated_findings;
    std::optional<std::string> security_summary;
    UserExplanation user_explanation;
    int risk_score = 0;
    std::string trust_badge;
    CapabilityFlags capabilities;
    bool llm_used = false;
    std::optional<std::string> llm_model;
    std::string analyzed_at;

    int overall_score = 100;
    std::string content_hash;
};

extern const char* const kNoFindingsSummary;
extern const char* const kLowMediumSummary;
constexpr size_t kMaxTopConcerns = 3;
constexpr size_t kMaxRecommendedActions = 4;

const std::vector<std::string>& generic_recommendations();

// shell_exec, db_access, file_delete, network, reads_env
std::vector<SafetyCheck> build_safety_checks(const CapabilityFlags& caps);

// Validator summary when present and non-empty, else one of the fixed summaries.
std::string build_user_summary(const std::vector<Finding>& findings, const std::optional<std::string>& validator_summary);
std::vector<std::string> build_top_concerns(const std::vector<Finding>& findings);
std::vector<std::string> build_recommended_actions(const std::vector<ValidatedFinding>& validated);

// `validation` is set only when the validator ran and succeeded.
AnalysisRecord assemble_record(const ScanResult& scan, const std::optional<ValidatedSecurity>& validation,
                               const std::optional<std::string>& llm_model,
                               std::chrono::system_clock::time_point analyzed_at);

}
