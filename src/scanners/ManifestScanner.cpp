#include "ManifestScanner.h"
#include "../core/Digest.h"
#include "../core/Report.h"
#include "../core/RuleCatalog.h"
#include "../core/ScanContext.h"
#include "../core/Utils.h"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <utility>

namespace skill_scan {

namespace {
const char* kDependencyBlocks[] = {"dependencies", "devDependencies", "optionalDependencies"};
}

bool ManifestScanner::is_npm_manifest(const std::string& path){
    return utils::ends_with(utils::to_lower(path), "package.json");
}

bool ManifestScanner::is_requirements_file(const std::string& path){
    std::string p = utils::to_lower(path);
    return p.find("requirements") != std::string::npos && utils::ends_with(p, ".txt");
}

bool ManifestScanner::is_unpinned_npm_version(const std::string& version){
    return version == "*" || version == "latest" || utils::starts_with(utils::trim(version), "^");
}

std::vector<Finding> ManifestScanner::check_npm_manifest(const ScannedFile& file, bool* parsed){
    std::vector<Finding> out;
    auto payload = nlohmann::ordered_json::parse(file.text, nullptr, /*allow_exceptions=*/false);
    if(parsed) *parsed = !payload.is_discarded();
    if(payload.is_discarded() || !payload.is_object()) return out;

    // later blocks overwrite same-named entries; first-seen order is kept
    std::vector<std::pair<std::string,std::string>> deps;
    std::unordered_map<std::string,size_t> index;
    for(const char* block : kDependencyBlocks){
        auto it = payload.find(block);
        if(it == payload.end() || !it->is_object()) continue;
        for(const auto& kv : it->items()){
            std::string version = kv.value().is_string() ? kv.value().get<std::string>() : kv.value().dump();
            auto pos = index.find(kv.key());
            if(pos == index.end()){ index.emplace(kv.key(), deps.size()); deps.emplace_back(kv.key(), version); }
            else deps[pos->second].second = version;
        }
    }

    for(const auto& [dep_name, dep_ver] : deps){
        if(!is_unpinned_npm_version(dep_ver)) continue;
        Finding f;
        f.evidence = utils::make_evidence("\"" + dep_name + "\": \"" + dep_ver + "\"");
        f.id = make_finding_id(kUnpinnedNpmRuleId, file.path, std::nullopt, f.evidence);
        f.category = Category::Deps;
        f.severity = Severity::Low;
        f.title = "Unpinned NPM dependency version detected.";
        f.file_path = file.path;
        f.confidence = Confidence::Medium;
        out.push_back(std::move(f));
    }
    return out;
}

std::vector<Finding> ManifestScanner::check_requirements(const ScannedFile& file){
    std::vector<Finding> out;
    int idx = 0;
    for(const auto& line : utils::split_lines(file.text)){
        ++idx;
        std::string clean = utils::trim(line);
        if(clean.empty() || clean[0]=='#') continue;
        if(clean.find("==") != std::string::npos) continue;
        if(utils::starts_with(clean, "-e ") || utils::starts_with(clean, "git+")) continue;
        Finding f;
        f.evidence = utils::make_evidence(clean);
        f.id = make_finding_id(kUnpinnedPyRuleId, file.path, idx, f.evidence);
        f.category = Category::Deps;
        f.severity = Severity::Low;
        f.title = "Unpinned Python dependency detected.";
        f.file_path = file.path;
        f.line_start = idx;
        f.line_end = idx;
        f.confidence = Confidence::Low;
        out.push_back(std::move(f));
    }
    return out;
}

void ManifestScanner::scan(const ScannedFile& file, ScanContext& context){
    if(file.text.empty()) return;
    if(is_npm_manifest(file.path)){
        bool parsed = true;
        for(auto& f : check_npm_manifest(file, &parsed)) context.report.add_finding(std::move(f));
        if(!parsed) context.report.add_warning(name(), WarnCode::ManifestUnparseable, file.path);
    }
    if(is_requirements_file(file.path)){
        for(auto& f : check_requirements(file)) context.report.add_finding(std::move(f));
    }
}

}
