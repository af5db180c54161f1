#include "JSONWriter.h"
#include "AnalysisRunner.h"
#include "BuildInfo.h"
#include "Config.h"
#include "JsonUtil.h"
#include "Severity.h"
#include <cstdlib>
#include <map>
#include <sstream>

namespace skill_scan {

const char* const kOutcomeSchema = "skill-scan/1";

namespace {
    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM, T_LIT } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // string body, number token or literal (true/false/null)
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    static void canon_emit(const CanonVal& v, std::ostream& os);

    using jsonutil::escape;

    static void emit_array(const CanonVal& v, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            canon_emit(e, os);
        }
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(kv.first) << '"' << ':';
            canon_emit(kv.second, os);
        }
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os) {
        switch (v.type) {
            case CanonVal::T_STR: os << '"' << escape(v.str) << '"'; break;
            case CanonVal::T_NUM:
            case CanonVal::T_LIT: os << v.str; break;
            case CanonVal::T_ARR: emit_array(v, os); break;
            case CanonVal::T_OBJ: emit_object(v, os); break;
        }
    }

    static CanonVal str_val(const std::string& s) { CanonVal v{CanonVal::T_STR}; v.str = s; return v; }
    static CanonVal num_val(long long n) { CanonVal v{CanonVal::T_NUM}; v.str = std::to_string(n); return v; }
    static CanonVal bool_val(bool b) { CanonVal v{CanonVal::T_LIT}; v.str = b ? "true" : "false"; return v; }
    static CanonVal null_val() { CanonVal v{CanonVal::T_LIT}; v.str = "null"; return v; }

    static CanonVal str_array(const std::vector<std::string>& items) {
        CanonVal arr{CanonVal::T_ARR};
        for (const auto& s : items) arr.arr.push_back(str_val(s));
        return arr;
    }

    static CanonVal build_finding(const Finding& f) {
        CanonVal fv{CanonVal::T_OBJ};
        fv.obj["id"] = str_val(f.id);
        fv.obj["category"] = str_val(category_to_string(f.category));
        fv.obj["severity"] = str_val(severity_to_string(f.severity));
        fv.obj["title"] = str_val(f.title);
        fv.obj["evidence"] = str_val(f.evidence);
        fv.obj["file_path"] = str_val(f.file_path);
        fv.obj["line_start"] = f.line_start ? num_val(*f.line_start) : null_val();
        fv.obj["line_end"] = f.line_end ? num_val(*f.line_end) : null_val();
        fv.obj["confidence"] = str_val(confidence_to_string(f.confidence));
        return fv;
    }

    static CanonVal build_validated_finding(const ValidatedFinding& vf) {
        CanonVal v{CanonVal::T_OBJ};
        v.obj["finding_id"] = str_val(vf.finding_id);
        v.obj["is_true_positive"] = bool_val(vf.is_true_positive);
        v.obj["final_severity"] = str_val(severity_to_string(vf.final_severity));
        v.obj["reason"] = str_val(vf.reason);
        v.obj["mitigation"] = str_array(vf.mitigation);
        return v;
    }

    static CanonVal build_capabilities(const CapabilityFlags& caps) {
        CanonVal c{CanonVal::T_OBJ};
        for (auto cap : kAllCapabilities) c.obj[capability_key(cap)] = bool_val(caps.has(cap));
        return c;
    }

    static CanonVal build_user_explanation(const UserExplanation& ux) {
        CanonVal u{CanonVal::T_OBJ};
        u.obj["headline"] = str_val(ux.headline);
        u.obj["summary"] = str_val(ux.summary);
        u.obj["top_concerns"] = str_array(ux.top_concerns);
        u.obj["recommended_actions"] = str_array(ux.recommended_actions);
        CanonVal checks{CanonVal::T_ARR};
        for (const auto& c : ux.safety_checks) {
            CanonVal cv{CanonVal::T_OBJ};
            cv.obj["key"] = str_val(c.key);
            cv.obj["safe"] = bool_val(c.safe);
            cv.obj["safe_message"] = str_val(c.safe_message);
            cv.obj["risk_message"] = str_val(c.risk_message);
            checks.arr.push_back(std::move(cv));
        }
        u.obj["safety_checks"] = std::move(checks);
        u.obj["safety_statements"] = str_array(ux.safety_statements);
        return u;
    }

    static CanonVal build_security_object(const AnalysisRecord& rec, bool zero_time) {
        CanonVal sec{CanonVal::T_OBJ};
        CanonVal findings{CanonVal::T_ARR};
        for (const auto& f : rec.findings) findings.arr.push_back(build_finding(f));
        sec.obj["findings"] = std::move(findings);
        CanonVal validated{CanonVal::T_ARR};
        for (const auto& vf : rec.validated_findings) validated.arr.push_back(build_validated_finding(vf));
        sec.obj["validated_findings"] = std::move(validated);
        sec.obj["security_summary"] = rec.security_summary ? str_val(*rec.security_summary) : null_val();
        sec.obj["user_explanation"] = build_user_explanation(rec.user_explanation);
        sec.obj["risk_score"] = num_val(rec.risk_score);
        sec.obj["trust_badge"] = str_val(rec.trust_badge);
        sec.obj["capabilities"] = build_capabilities(rec.capabilities);
        sec.obj["llm_used"] = bool_val(rec.llm_used);
        sec.obj["llm_model"] = rec.llm_model ? str_val(*rec.llm_model) : null_val();
        sec.obj["analyzed_at"] = str_val(zero_time ? "" : rec.analyzed_at);
        return sec;
    }

    static CanonVal build_provenance_object() {
        auto env_or = [](const char* name, const char* defv) -> const char* {
            const char* v = std::getenv(name);
            return (v && *v) ? v : defv;
        };
        CanonVal prov{CanonVal::T_OBJ};
        prov.obj["compiler_id"] = str_val(env_or("SKILL_SCAN_PROV_COMPILER_ID", buildinfo::COMPILER_ID));
        prov.obj["compiler_version"] = str_val(env_or("SKILL_SCAN_PROV_COMPILER_VERSION", buildinfo::COMPILER_VERSION));
        prov.obj["git_commit"] = str_val(env_or("SKILL_SCAN_PROV_GIT_COMMIT", buildinfo::GIT_COMMIT));
        prov.obj["cxx_standard"] = str_val(env_or("SKILL_SCAN_PROV_CXX_STANDARD", buildinfo::CXX_STANDARD));
        prov.obj["build_type"] = str_val(env_or("SKILL_SCAN_PROV_BUILD_TYPE", buildinfo::BUILD_TYPE));
        return prov;
    }

    static CanonVal build_meta_object(const Config& cfg) {
        CanonVal meta{CanonVal::T_OBJ};
        meta.obj["tool_version"] = str_val(buildinfo::APP_VERSION);
        meta.obj["provenance"] = build_provenance_object();
        CanonVal ec{CanonVal::T_OBJ};
        ec.obj["validation_mode"] = str_val(validation_mode_to_string(cfg.validation_mode));
        ec.obj["default_model"] = str_val(cfg.default_model);
        ec.obj["escalated_model"] = str_val(cfg.escalated_model);
        ec.obj["max_file_bytes"] = num_val(cfg.max_file_bytes);
        ec.obj["parallel"] = bool_val(cfg.parallel);
        if (!cfg.fail_on_severity.empty()) ec.obj["fail_on_severity"] = str_val(cfg.fail_on_severity);
        meta.obj["effective_config"] = std::move(ec);
        return meta;
    }

    static CanonVal build_warnings_array(const std::vector<ScanWarning>& warnings) {
        CanonVal warns{CanonVal::T_ARR};
        for (const auto& w : warnings) {
            CanonVal wv{CanonVal::T_OBJ};
            wv.obj["code"] = str_val(warn_code_to_string(w.code));
            if (!w.detail.empty()) wv.obj["detail"] = str_val(w.detail);
            wv.obj["scanner"] = str_val(w.scanner);
            warns.arr.push_back(std::move(wv));
        }
        return warns;
    }

    static CanonVal build_results_array(const std::vector<AnalysisOutcome>& outcomes, bool zero_time) {
        CanonVal res_arr{CanonVal::T_ARR};
        for (const auto& o : outcomes) {
            CanonVal rs{CanonVal::T_OBJ};
            rs.obj["artifact"] = str_val(o.artifact);
            rs.obj["status"] = str_val(outcome_status_to_string(o.status));
            if (!o.succeeded()) rs.obj["error_message"] = str_val(o.error_message);
            if (o.record) {
                rs.obj["content_hash"] = str_val(o.record->content_hash);
                rs.obj["overall_score"] = num_val(o.record->overall_score);
                rs.obj["security"] = build_security_object(*o.record, zero_time);
            }
            if (!o.warnings.empty()) rs.obj["warnings"] = build_warnings_array(o.warnings);
            res_arr.arr.push_back(std::move(rs));
        }
        return res_arr;
    }

    static CanonVal build_summary_object(const std::vector<AnalysisOutcome>& outcomes) {
        size_t succeeded = 0, failed = 0, findings = 0, llm_used = 0;
        int max_risk = 0;
        std::map<std::string, size_t> severity_counts{{"CRITICAL", 0}, {"HIGH", 0}, {"MEDIUM", 0}, {"LOW", 0}};
        std::map<std::string, size_t> badges;
        for (const auto& o : outcomes) {
            if (!o.record) { ++failed; continue; }
            ++succeeded;
            findings += o.record->findings.size();
            for (const auto& f : o.record->findings) severity_counts[severity_to_string(f.severity)]++;
            if (o.record->llm_used) ++llm_used;
            if (o.record->risk_score > max_risk) max_risk = o.record->risk_score;
            badges[o.record->trust_badge]++;
        }
        CanonVal summary{CanonVal::T_OBJ};
        summary.obj["artifact_count"] = num_val(static_cast<long long>(outcomes.size()));
        summary.obj["succeeded"] = num_val(static_cast<long long>(succeeded));
        summary.obj["failed"] = num_val(static_cast<long long>(failed));
        summary.obj["finding_count"] = num_val(static_cast<long long>(findings));
        summary.obj["llm_used_count"] = num_val(static_cast<long long>(llm_used));
        summary.obj["max_risk_score"] = num_val(max_risk);
        CanonVal sev{CanonVal::T_OBJ};
        for (const auto& kv : severity_counts) sev.obj[kv.first] = num_val(static_cast<long long>(kv.second));
        summary.obj["severity_counts"] = std::move(sev);
        CanonVal bd{CanonVal::T_OBJ};
        for (const auto& kv : badges) bd.obj[kv.first] = num_val(static_cast<long long>(kv.second));
        summary.obj["trust_badges"] = std::move(bd);
        return summary;
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;

        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };

        for (size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            if (!in_string && (c == '}' || c == ']')) {
                // keep empty containers on one line
                char prev = out.empty() ? '\0' : out.back();
                depth--;
                if (depth < 0) depth = 0;
                if (prev != '{' && prev != '[') {
                    out.push_back('\n');
                    indent(depth);
                }
                out.push_back(c);
                continue;
            }
            out.push_back(c);

            if (esc) { esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { in_string = !in_string; continue; }
            if (in_string) continue;

            switch (c) {
                case '{':
                case '[': {
                    depth++;
                    char next = i + 1 < compact_json.size() ? compact_json[i + 1] : '\0';
                    if (next != '}' && next != ']') {
                        out.push_back('\n');
                        indent(depth);
                    }
                    break;
                }
                case ',':
                    out.push_back('\n');
                    indent(depth);
                    break;
                case ':':
                    out.push_back(' ');
                    break;
                default:
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }

    static bool canon_time_zero() { return !!std::getenv("SKILL_SCAN_CANON_TIME_ZERO"); }
}

std::string JSONWriter::write(const std::vector<AnalysisOutcome>& outcomes, const Config& cfg) const {
    bool zero_time = canon_time_zero();
    CanonVal root{CanonVal::T_OBJ};
    root.obj["schema"] = str_val(kOutcomeSchema);
    root.obj["meta"] = build_meta_object(cfg);
    root.obj["results"] = build_results_array(outcomes, zero_time);
    root.obj["summary"] = build_summary_object(outcomes);

    std::ostringstream os;
    canon_emit(root, os);
    std::string compact = os.str();
    if (cfg.pretty && !cfg.compact) {
        return pretty_print_json(compact);
    }
    return compact;
}

std::string JSONWriter::write_record(const AnalysisRecord& record) const {
    std::ostringstream os;
    canon_emit(build_security_object(record, canon_time_zero()), os);
    return os.str();
}

} // namespace skill_scan
