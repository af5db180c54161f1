#include "ArtifactLoader.h"
#include "Config.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace skill_scan {

const char* const kSkillDocument = "SKILL.md";

namespace {

const std::vector<std::string> kDefaultExcludedDirs = {
    "node_modules", "dist", "build", ".git", "__pycache__", ".next", ".cache", ".venv", "venv", "target", "coverage"
};

const std::vector<std::string> kAllowedExtensions = {
    ".py", ".js", ".ts", ".tsx", ".sh", ".bash", ".yaml", ".yml", ".json", ".md", ".txt", ".toml", ".ini", ".cfg",
    ".sql", ".mjs", ".cjs", ".zsh", ".dockerfile"
};

const std::vector<std::string> kBinaryExtensions = {
    ".png", ".jpg", ".jpeg", ".gif", ".webp", ".svg", ".ico", ".pdf", ".zip", ".gz", ".tar", ".mp4", ".mp3", ".wav",
    ".woff", ".woff2", ".ttf", ".otf", ".exe", ".dll", ".bin"
};

bool has_any_suffix(const std::string& lowered, const std::vector<std::string>& suffixes){
    return std::any_of(suffixes.begin(), suffixes.end(), [&](const std::string& s){ return utils::ends_with(lowered, s); });
}

bool read_file(const fs::path& p, std::string& out){
    std::ifstream f(p, std::ios::binary);
    if(!f) return false;
    out.assign(std::istreambuf_iterator<char>(f), {});
    return !f.bad();
}

}

ArtifactLoader::ArtifactLoader(const Config& config)
    : max_file_bytes_(config.max_file_bytes), exclude_dirs_(kDefaultExcludedDirs) {
    for(const auto& d : config.exclude_dirs) exclude_dirs_.push_back(d);
}

bool ArtifactLoader::is_excluded_dir(const std::string& name) const {
    return std::find(exclude_dirs_.begin(), exclude_dirs_.end(), name) != exclude_dirs_.end();
}

bool ArtifactLoader::has_allowed_type(const std::string& file_name){
    if(file_name == "Dockerfile") return true;
    return has_any_suffix(utils::to_lower(file_name), kAllowedExtensions);
}

bool ArtifactLoader::has_binary_extension(const std::string& file_name){
    return has_any_suffix(utils::to_lower(file_name), kBinaryExtensions);
}

bool ArtifactLoader::looks_binary(const std::string& content){
    return content.find('\0') != std::string::npos;
}

LoadedArtifact ArtifactLoader::load(const std::string& dir) const {
    std::error_code ec;
    fs::path root(dir);
    if(!fs::is_directory(root, ec)) throw ArtifactError("artifact is not a directory: " + dir);

    LoadedArtifact art;
    art.root = dir;
    auto& log = Logger::instance();
    auto skip = [&](const std::string& rel, const std::string& why){ ++art.skipped; log.debug("skip " + rel + ": " + why); };

    std::vector<std::string> rel_paths;
    auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
    if(ec) throw ArtifactError("cannot read artifact " + dir + ": " + ec.message());
    for(; it != fs::recursive_directory_iterator(); it.increment(ec)){
        if(ec){ log.warn("walk error in " + dir + ": " + ec.message()); break; }
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code sec;
        auto st = entry.symlink_status(sec);
        if(sec) continue;
        if(fs::is_directory(st)){
            if(is_excluded_dir(name)) it.disable_recursion_pending();
            continue;
        }
        std::string rel = entry.path().lexically_relative(root).generic_string();
        if(!fs::is_regular_file(st)){ skip(rel, "not a regular file"); continue; }
        if(rel == kSkillDocument) continue;
        if(has_binary_extension(name)){ skip(rel, "binary extension"); continue; }
        if(!has_allowed_type(name)){ skip(rel, "unsupported type"); continue; }
        auto size = entry.file_size(sec);
        if(sec || static_cast<long long>(size) > max_file_bytes_){ skip(rel, "too large"); continue; }
        rel_paths.push_back(rel);
    }
    std::sort(rel_paths.begin(), rel_paths.end());

    fs::path skill = root / kSkillDocument;
    std::string raw;
    if(fs::is_regular_file(fs::symlink_status(skill, ec)) && read_file(skill, raw)){
        if(static_cast<long long>(raw.size()) > max_file_bytes_) skip(kSkillDocument, "too large");
        else if(looks_binary(raw)) skip(kSkillDocument, "binary content");
        else {
            std::string text = utils::sanitize_utf8(raw);
            if(!utils::trim(text).empty()){
                art.skill_text = text;
                art.files.push_back(ScannedFile{kSkillDocument, std::move(text)});
            }
        }
    }

    for(const auto& rel : rel_paths){
        raw.clear();
        if(!read_file(root / rel, raw)){ skip(rel, "unreadable"); continue; }
        if(looks_binary(raw)){ skip(rel, "binary content"); continue; }
        art.files.push_back(ScannedFile{rel, utils::sanitize_utf8(raw)});
    }
    log.debug("Loaded " + std::to_string(art.files.size()) + " files from " + dir + " (" + std::to_string(art.skipped) + " skipped)");
    return art;
}

}
