#include "ResultAssembler.h"
#include "JsonUtil.h"
#include "Scoring.h"
#include "Utils.h"

namespace skill_scan {

const char* const kNoFindingsSummary =
    "No risky execution or exfiltration patterns were detected in scanned text artifacts.";
const char* const kLowMediumSummary =
    "Only low-to-medium risk patterns were detected. Review findings, but no immediate high-risk behavior "
    "was found in this scan.";

namespace {
bool is_high_or_critical(const Finding& f){ return f.severity == Severity::High || f.severity == Severity::Critical; }
}

const std::vector<std::string>& generic_recommendations(){
    static const std::vector<std::string> recs = {
        "Inspect shell and subprocess calls for user-controlled inputs.",
        "Review network requests and sensitive file operations before use.",
        "Avoid installing skills that require broad system access unless necessary.",
    };
    return recs;
}

std::vector<SafetyCheck> build_safety_checks(const CapabilityFlags& caps){
    return {
        {"shell_exec", !caps.has(Capability::ShellExec),
         "No shell execution behavior detected.",
         "Shell execution behavior detected; review commands and input handling."},
        {"db_access", !caps.has(Capability::DbAccess),
         "No database access patterns detected.",
         "Database access patterns detected; verify query safety and permissions."},
        {"file_delete", !caps.has(Capability::FileDelete),
         "No destructive file deletion behavior detected.",
         "Potential file deletion behavior detected; review scope and safeguards."},
        {"network", !caps.has(Capability::Network),
         "No outbound network behavior detected.",
         "Outbound network behavior detected; verify destination allowlist."},
        {"reads_env", !caps.has(Capability::ReadsEnv),
         "No environment variable reads detected.",
         "Environment variable reads detected; ensure secrets are not exposed."},
    };
}

std::string build_user_summary(const std::vector<Finding>& findings, const std::optional<std::string>& validator_summary){
    if(validator_summary && !validator_summary->empty()) return *validator_summary;
    if(findings.empty()) return kNoFindingsSummary;
    size_t high = 0;
    for(const auto& f : findings) if(is_high_or_critical(f)) ++high;
    if(high == 0) return kLowMediumSummary;
    return std::to_string(high) + " high-risk pattern(s) detected. Review command execution, file deletion, "
           "or network-related findings before installing.";
}

std::vector<std::string> build_top_concerns(const std::vector<Finding>& findings){
    std::vector<std::string> out;
    for(const auto& f : findings){
        if(out.size() >= kMaxTopConcerns) break;
        if(is_high_or_critical(f)) out.push_back(f.title);
    }
    if(out.empty()){
        for(size_t i=0; i<findings.size() && i<kMaxTopConcerns; ++i) out.push_back(findings[i].title);
    }
    return out;
}

std::vector<std::string> build_recommended_actions(const std::vector<ValidatedFinding>& validated){
    std::vector<std::string> out;
    for(size_t i=0; i<validated.size() && i<kMaxRecommendedActions; ++i){
        for(const auto& m : validated[i].mitigation){
            std::string t = utils::trim(m);
            if(!t.empty()) out.push_back(std::move(t));
        }
    }
    if(out.empty()) return generic_recommendations();
    if(out.size() > kMaxRecommendedActions) out.resize(kMaxRecommendedActions);
    return out;
}

AnalysisRecord assemble_record(const ScanResult& scan, const std::optional<ValidatedSecurity>& validation,
                               const std::optional<std::string>& llm_model,
                               std::chrono::system_clock::time_point analyzed_at){
    AnalysisRecord rec;
    rec.findings = scan.findings;
    rec.risk_score = scan.risk_score;
    rec.trust_badge = scan.trust_badge;
    rec.capabilities = scan.capabilities;
    if(validation){
        rec.validated_findings = validation->validated_findings;
        rec.security_summary = validation->security_summary;
        rec.llm_used = true;
        rec.llm_model = llm_model;
    }
    rec.analyzed_at = jsonutil::time_to_iso(analyzed_at);

    auto& ux = rec.user_explanation;
    ux.headline = scan.trust_badge;
    ux.summary = build_user_summary(scan.findings, rec.security_summary);
    ux.top_concerns = build_top_concerns(scan.findings);
    ux.recommended_actions = build_recommended_actions(rec.validated_findings);
    ux.safety_checks = build_safety_checks(scan.capabilities);
    for(const auto& c : ux.safety_checks) ux.safety_statements.push_back(c.statement());

    rec.overall_score = overall_score(scan.risk_score);
    return rec;
}

}
