#include "ValidationOrchestrator.h"
#include "Config.h"
#include "Logging.h"
#include "Utils.h"
#include <set>
#include <unordered_set>

namespace skill_scan {

const char* const kValidatorSystemInstruction =
    "You are a security validation assistant. Output only JSON that matches the schema exactly. "
    "Do not add new findings. Only validate items provided. "
    "If uncertain, mark is_true_positive=false and explain why.";

const char* const kValidatorTask = "Validate deterministic findings and provide final severity and mitigations.";

std::vector<ContextSnippet> build_context_snippets(const std::vector<Finding>& findings,
                                                   const std::vector<ScannedFile>& files){
    std::unordered_set<std::string> referenced;
    for(const auto& f : findings) referenced.insert(f.file_path);
    std::vector<ContextSnippet> out;
    std::unordered_set<std::string> seen;
    for(const auto& file : files){
        if(out.size() >= kMaxContextSnippets) break;
        if(!referenced.count(file.path) || !seen.insert(file.path).second) continue;
        out.push_back(ContextSnippet{file.path, utils::utf8_prefix(file.text, kSnippetMaxChars)});
    }
    return out;
}

std::map<std::string,int> severity_counts(const std::vector<Finding>& findings){
    std::map<std::string,int> counts{{"CRITICAL",0},{"HIGH",0},{"MEDIUM",0},{"LOW",0}};
    for(const auto& f : findings) counts[severity_to_string(f.severity)]++;
    return counts;
}

nlohmann::ordered_json build_request_payload(const std::vector<Finding>& findings, int risk_score,
                                             const std::vector<ContextSnippet>& snippets){
    using ojson = nlohmann::ordered_json;
    auto line_value = [](const std::optional<int>& v){ return v ? ojson(*v) : ojson(nullptr); };
    ojson payload;
    payload["task"] = kValidatorTask;
    payload["risk_score"] = risk_score;
    auto counts = severity_counts(findings);
    ojson sc = ojson::object();
    for(const char* k : {"CRITICAL","HIGH","MEDIUM","LOW"}) sc[k] = counts[k];
    payload["severity_counts"] = sc;
    ojson arr = ojson::array();
    for(const auto& f : findings){
        arr.push_back({
            {"finding_id", f.id},
            {"category", category_to_string(f.category)},
            {"severity", severity_to_string(f.severity)},
            {"title", f.title},
            {"confidence", confidence_to_string(f.confidence)},
            {"evidence", f.evidence},
            {"file_path", f.file_path},
            {"line_start", line_value(f.line_start)},
            {"line_end", line_value(f.line_end)},
        });
    }
    payload["findings"] = arr;
    ojson ctx = ojson::array();
    for(const auto& s : snippets) ctx.push_back({{"file_path", s.file_path}, {"snippet", utils::utf8_prefix(s.snippet, kSnippetMaxChars)}});
    payload["context_snippets"] = ctx;
    payload["constraints"] = {
        {"reason_max_sentences", 2},
        {"mitigation_max_items", 3},
        {"security_summary_max_words", 60},
    };
    return payload;
}

ValidatedSecurity ValidationOrchestrator::validate(const std::vector<Finding>& findings, int risk_score,
                                                   const std::vector<ScannedFile>& files, const ValidatorProfile& profile){
    if(findings.empty()) return ValidatedSecurity{{}, "No findings to validate."};

    ValidatorCall call;
    call.profile = profile;
    call.system_instruction = kValidatorSystemInstruction;
    call.user_payload = build_request_payload(findings, risk_score, build_context_snippets(findings, files));
    call.schema = &validated_security_schema();
    call.timeout_ms = config_.validator_timeout_ms;

    Logger::instance().debug("Validating " + std::to_string(findings.size()) + " findings with " + profile.model);
    nlohmann::json envelope;
    try {
        envelope = client_.create_response(call);
    } catch(const ValidationError&) {
        throw;
    } catch(const std::exception& ex) {
        throw ValidationError(std::string("validator call failed: ") + ex.what());
    }

    ValidatedSecurity result;
    try {
        result = parse_validated_security(extract_payload(envelope));
    } catch(const nlohmann::json::exception& ex) {
        throw ValidationError(std::string("validator output rejected: ") + ex.what());
    }

    std::set<std::string> known;
    for(const auto& f : findings) known.insert(f.id);
    std::vector<ValidatedFinding> kept;
    kept.reserve(result.validated_findings.size());
    for(auto& vf : result.validated_findings){
        if(!known.count(vf.finding_id)) {
            Logger::instance().warn("Dropping validated finding with unknown id: " + vf.finding_id);
            continue;
        }
        kept.push_back(std::move(vf));
    }
    result.validated_findings = std::move(kept);
    return result;
}

}
