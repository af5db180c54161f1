#include "RuleCatalog.h"
#include "Utils.h"
#include <unordered_set>

namespace skill_scan {

namespace {

const std::vector<std::string> kPythonExt = {".py"};
const std::vector<std::string> kJsExt = {".js", ".ts", ".mjs", ".cjs"};
const std::vector<std::string> kShellLikeExt = {".py", ".sh", ".bash", ".zsh"};
const std::vector<std::string> kPipeExecExt = {".sh", ".bash", ".zsh", ".md", ".txt", ".yaml", ".yml"};

std::shared_ptr<const re2::RE2> compile_or_throw(const std::string& rule_id, const std::string& source, const char* what){
    re2::RE2::Options opts;
    opts.set_case_sensitive(false);
    opts.set_log_errors(false);
    auto re = std::make_shared<const re2::RE2>(source, opts);
    if(!re->ok()) throw CatalogError("rule " + rule_id + ": bad " + what + " '" + source + "': " + re->error());
    return re;
}

}

bool Rule::applies_to(const std::string& path) const {
    if(!file_extensions.empty()){
        std::string lowered = utils::to_lower(path);
        bool ext_ok = false;
        for(const auto& ext : file_extensions){ if(utils::ends_with(lowered, ext)){ ext_ok = true; break; } }
        if(!ext_ok) return false;
    }
    if(file_name_regex && !re2::RE2::PartialMatch(path, *file_name_regex)) return false;
    return true;
}

RuleCatalog::RuleCatalog(const std::vector<RuleDefinition>& definitions){
    std::unordered_set<std::string> seen;
    rules_.reserve(definitions.size());
    for(const auto& d : definitions){
        if(d.id.empty()) throw CatalogError("rule with empty id");
        if(!seen.insert(d.id).second) throw CatalogError("duplicate rule id: " + d.id);
        if(d.title.empty()) throw CatalogError("rule " + d.id + ": empty title");
        if(d.pattern.empty()) throw CatalogError("rule " + d.id + ": empty pattern");
        for(const auto& ext : d.file_extensions){
            if(ext.size() < 2 || ext.front() != '.' || ext != utils::to_lower(ext))
                throw CatalogError("rule " + d.id + ": malformed extension '" + ext + "'");
        }
        Rule r{d.id, d.category, d.severity, d.title, d.confidence, d.pattern,
               compile_or_throw(d.id, d.pattern, "pattern"), d.file_extensions, nullptr};
        if(!d.file_name_pattern.empty()) r.file_name_regex = compile_or_throw(d.id, d.file_name_pattern, "file name pattern");
        rules_.push_back(std::move(r));
    }
}

const Rule* RuleCatalog::find(const std::string& id) const {
    for(const auto& r : rules_) if(r.id == id) return &r;
    return nullptr;
}

std::vector<RuleDefinition> builtin_rule_definitions(){
    using C = Category; using S = Severity; using K = Confidence;
    return {
        {"SEC_PY_EVAL_001", C::Exec, S::Critical,
         "Python dynamic code execution detected (eval/exec).", K::High,
         R"(\b(eval|exec)\s*\()", kPythonExt, ""},
        {"SEC_PY_SHELL_TRUE_001", C::Exec, S::High,
         "subprocess call with shell=True detected.", K::High,
         R"(subprocess\.(run|Popen|call|check_output|check_call)\s*\([^)]*shell\s*=\s*True)", kPythonExt, ""},
        {"SEC_PY_OS_SYSTEM_001", C::Exec, S::High,
         "Shell execution via os.system/popen detected.", K::High,
         R"(\b(os\.system|popen)\s*\()", kShellLikeExt, ""},
        {"SEC_JS_EVAL_001", C::Exec, S::Critical,
         "JavaScript dynamic code execution detected (eval/new Function).", K::High,
         R"(\b(eval\s*\(|new\s+Function\s*\())", kJsExt, ""},
        {"SEC_JS_CHILD_PROCESS_001", C::Exec, S::High,
         "child_process command execution detected.", K::High,
         R"(child_process\.(exec|spawn)\s*\()", kJsExt, ""},
        {"SEC_SH_PIPE_EXEC_001", C::Exec, S::Critical,
         "Remote script piping into shell detected (curl|sh or wget|bash).", K::High,
         R"((curl\s+[^|]+?\|\s*(sh|bash))|(wget\s+[^|]+?\|\s*(sh|bash)))", kPipeExecExt, ""},
        {"SEC_FS_RM_RF_001", C::Filesystem, S::Critical,
         "Destructive recursive deletion detected (rm -rf / rmtree).", K::High,
         R"((rm\s+-rf\b|shutil\.rmtree\s*\())", {}, ""},
        {"SEC_FS_SENSITIVE_WRITE_001", C::Filesystem, S::High,
         "Write or modification of sensitive system path detected.", K::Medium,
         R"((~/\.ssh|/etc/|/usr/|/var/))", {}, ""},
        {"SEC_FS_PATH_TRAVERSAL_001", C::Filesystem, S::Medium,
         "Potential path traversal pattern with user-controlled path.", K::Medium,
         R"(\.\./.*(user|input|param|request|query))", {}, ""},
        {"SEC_NET_USER_URL_001", C::Network, S::Medium,
         "Potential SSRF: outbound request built from user-controlled URL.", K::Medium,
         R"((requests\.(get|post|put|delete)\s*\(\s*(user_?url|url_from_user|input_url|request\.)|fetch\s*\(\s*(user_?url|urlFromUser|inputUrl|req\.)))", {}, ""},
        {"SEC_NET_RAW_SOCKET_001", C::Network, S::High,
         "Raw socket usage detected.", K::Medium,
         R"((socket\.socket\s*\(|new\s+Socket\s*\())", {}, ""},
        {"SEC_NET_METADATA_001", C::Network, S::High,
         "Cloud metadata endpoint access detected.", K::High,
         R"(169\.254\.169\.254)", {}, ""},
        {"SEC_SECRET_ENV_EXFIL_001", C::Secrets, S::High,
         "Environment secret read and outbound request pattern detected.", K::Medium,
         R"(((os\.environ|getenv|process\.env).*(requests\.|fetch\s*\())|((requests\.|fetch\s*\().*(os\.environ|getenv|process\.env)))", {}, ""},
        {"SEC_SECRET_TOKEN_LOG_001", C::Secrets, S::Medium,
         "Potential secret logging or Authorization header exposure.", K::Medium,
         R"((Authorization|api[_-]?key|token).*(print|console\.log)|(print|console\.log).*(Authorization|api[_-]?key|token))", {}, ""},
        {"SEC_DEP_POSTINSTALL_001", C::Deps, S::High,
         "NPM postinstall script detected.", K::High,
         R"("postinstall"\s*:)", {}, R"(package\.json$)"},
        {"SEC_DEP_NPM_GIT_HTTP_001", C::Deps, S::Medium,
         "Git or HTTP dependency source detected in package.json.", K::Medium,
         R"((git\+https?://|https?://.*\.tgz|github:))", {}, R"(package\.json$)"},
        {"SEC_DEP_PY_GIT_URL_001", C::Deps, S::Low,
         "requirements.txt contains git-based dependency.", K::Medium,
         R"(git\+https?://)", {}, R"(requirements.*\.txt$)"},
        {"SEC_SKILL_PROMPT_INJ_001", C::PromptInjection, S::High,
         "Prompt injection style unsafe instruction in SKILL.md.", K::Medium,
         R"((ignore\s+previous|exfiltrate|send\s+secrets|disable\s+safeguards))", {}, R"(SKILL\.md$)"},
    };
}

}
