#include "ArgumentParser.h"
#include "BuildInfo.h"
#include "Logging.h"
#include "Utils.h"
#include <iostream>
#include <stdexcept>

namespace skill_scan {

namespace {
bool parse_number(const std::string& v, long long& out){
    try {
        size_t used = 0;
        out = std::stoll(v, &used);
        return used == v.size();
    } catch(const std::invalid_argument&) {
        return false;
    } catch(const std::out_of_range&) {
        return false;
    }
}
}

ArgumentParser::ArgumentParser() {
    auto int_flag = [](auto setter){
        return [setter](const std::string& v, Config& c){ long long n=0; if(!parse_number(v, n)) return false; setter(c, n); return true; };
    };
    specs_ = {
        {"--enable", ArgKind::CSV, "Only run specified scanners (patterns,manifests,capabilities)", [](const std::string& v, Config& c){ c.enable_scanners = utils::split_csv(v); return true; }},
        {"--disable", ArgKind::CSV, "Disable specified scanners", [](const std::string& v, Config& c){ c.disable_scanners = utils::split_csv(v); return true; }},
        {"--artifacts-file", ArgKind::String, "File listing artifact directories, one per line", [](const std::string& v, Config& c){ c.artifacts_file = v; return true; }},
        {"--exclude-dir", ArgKind::CSV, "Extra directory names to skip while loading", [](const std::string& v, Config& c){ for(auto& d : utils::split_csv(v)) c.exclude_dirs.push_back(d); return true; }},
        {"--max-file-bytes", ArgKind::Int, "Skip files larger than N bytes", int_flag([](Config& c, long long n){ c.max_file_bytes = n; })},
        {"--output", ArgKind::String, "Write JSON to FILE (default stdout)", [](const std::string& v, Config& c){ c.output_file = v; return true; }},
        {"--fail-on", ArgKind::String, "Exit 1 if any finding >= SEV", [](const std::string& v, Config& c){ c.fail_on_severity = v; return true; }},
        {"--pretty", ArgKind::None, "Pretty-print JSON", [](const std::string&, Config& c){ c.pretty = true; return true; }},
        {"--compact", ArgKind::None, "Minified JSON output", [](const std::string&, Config& c){ c.compact = true; return true; }},
        {"--validation", ArgKind::String, "required|degrade|off", [](const std::string& v, Config& c){ auto m = validation_mode_from_string(v); if(!m) return false; c.validation_mode = *m; return true; }},
        {"--validator-endpoint", ArgKind::String, "Responses API URL", [](const std::string& v, Config& c){ c.validator_endpoint = v; return true; }},
        {"--api-key-env", ArgKind::String, "Environment variable holding the API key", [](const std::string& v, Config& c){ c.api_key_env = v; return true; }},
        {"--model", ArgKind::String, "Default validator model", [](const std::string& v, Config& c){ c.default_model = v; return true; }},
        {"--escalated-model", ArgKind::String, "Model for uncertain critical findings", [](const std::string& v, Config& c){ c.escalated_model = v; return true; }},
        {"--escalated-effort", ArgKind::String, "Reasoning effort for the escalated model", [](const std::string& v, Config& c){ c.escalated_effort = v; return true; }},
        {"--validator-timeout-ms", ArgKind::Int, "Validator call timeout", int_flag([](Config& c, long long n){ c.validator_timeout_ms = static_cast<long>(n); })},
        {"--validator-attempts", ArgKind::Int, "Transport attempts per validator call", int_flag([](Config& c, long long n){ c.validator_attempts = static_cast<int>(n); })},
        {"--validator-backoff-ms", ArgKind::Int, "Delay before the first retry, doubled per attempt", int_flag([](Config& c, long long n){ c.validator_backoff_ms = static_cast<long>(n); })},
        {"--max-output-tokens", ArgKind::Int, "Validator response token cap", int_flag([](Config& c, long long n){ c.max_output_tokens = static_cast<int>(n); })},
        {"--parallel", ArgKind::None, "Analyze artifacts in parallel", [](const std::string&, Config& c){ c.parallel = true; return true; }},
        {"--parallel-threads", ArgKind::Int, "Max parallel threads", int_flag([](Config& c, long long n){ c.parallel_max_threads = static_cast<int>(n); })},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace", [](const std::string& v, Config& c){ c.log_level = v; return true; }},
        {"--quiet", ArgKind::None, "Only log errors", [](const std::string&, Config& c){ c.log_level = "error"; return true; }},
        {"--debug", ArgKind::None, "Debug logging", [](const std::string&, Config& c){ c.log_level = "debug"; return true; }},
        {"--version", ArgKind::None, "Print version & exit", nullptr},
        {"--help", ArgKind::None, "Show this help", nullptr},
    };
}

bool ArgumentParser::fail(const std::string& msg) {
    error_ = msg;
    exit_code_ = 2;
    std::cerr << msg << "\n";
    return false;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    error_.clear();
    auto find_spec = [&](const std::string& flag)->const FlagSpec*{ for(const auto& s: specs_) if(flag==s.name) return &s; return nullptr; };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        if(a.size() < 2 || a.compare(0, 2, "--") != 0){ cfg.artifacts.push_back(a); continue; }
        const auto* spec = find_spec(a);
        if(!spec){ print_help(); return fail("Unknown arg: " + a); }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1>=argc) return fail("Missing value for " + a);
            val = argv[++i];
        }
        if(!spec->apply(val, cfg)){
            return fail(spec->kind == ArgKind::Int ? "Invalid integer for " + a + ": " + val : "Invalid value for " + a + ": " + val);
        }
    }
    return true;
}

void ArgumentParser::print_help() const {
    std::cout << "skill-scan [options] ARTIFACT_DIR...\n";
    for(const auto& l : specs_){
        std::string name = l.name;
        if(l.kind == ArgKind::String) name += " VALUE";
        else if(l.kind == ArgKind::Int) name += " N";
        else if(l.kind == ArgKind::CSV) name += " a[,b...]";
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << l.help << "\n";
    }
}

void ArgumentParser::print_version() {
    std::cout << "skill-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT << ", compiler="
              << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
