#include "CapabilityScanner.h"
#include "../core/Report.h"
#include "../core/ScanContext.h"
#include <re2/re2.h>
#include <memory>
#include <utility>

namespace skill_scan {

namespace {

struct CapabilityPattern {
    Capability capability;
    std::unique_ptr<re2::RE2> pattern;
};

const std::vector<CapabilityPattern>& capability_patterns(){
    static const std::vector<CapabilityPattern> patterns = [](){
        const std::pair<Capability, const char*> table[] = {
            {Capability::Network, R"(\b(requests\.|fetch\s*\(|httpx\.|urllib\.))"},
            {Capability::FileWrite, R"(\b(open\s*\(.+['"]w|write_text\s*\(|fs\.writefile|tee\s+))"},
            {Capability::FileDelete, R"(\b(rm\s+-rf|rmtree\s*\(|unlink\s*\())"},
            {Capability::ShellExec, R"(\b(subprocess\.|os\.system|child_process\.))"},
            {Capability::ReadsEnv, R"(\b(os\.environ|getenv|process\.env)\b)"},
            {Capability::DbAccess, R"(\b(select\s+.+\s+from|insert\s+into|sqlalchemy|psycopg|sqlite3|mongodb)\b)"},
        };
        re2::RE2::Options opts;
        opts.set_case_sensitive(false);
        std::vector<CapabilityPattern> out;
        for(const auto& row : table) out.push_back(CapabilityPattern{row.first, std::make_unique<re2::RE2>(row.second, opts)});
        return out;
    }();
    return patterns;
}

}

CapabilityFlags CapabilityScanner::detect(const std::string& text){
    CapabilityFlags flags;
    if(text.empty()) return flags;
    for(const auto& cp : capability_patterns()){
        if(re2::RE2::PartialMatch(text, *cp.pattern)) flags.raise(cp.capability);
    }
    return flags;
}

void CapabilityScanner::scan(const ScannedFile& file, ScanContext& context){
    CapabilityFlags flags = detect(file.text);
    for(auto c : kAllCapabilities) if(flags.has(c)) context.report.raise_capability(c);
}

CapabilityFlags detect_capabilities(const std::vector<ScannedFile>& files){
    CapabilityFlags all;
    for(const auto& f : files) all.merge(CapabilityScanner::detect(f.text));
    return all;
}

}
