#pragma once
#include "Scanner.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace skill_scan {

struct Config;

class ArtifactError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LoadedArtifact {
    std::string root;
    std::vector<ScannedFile> files; // SKILL.md first (when non-blank), then sorted relative paths
    std::string skill_text;         // empty when the artifact has no SKILL.md
    size_t skipped = 0;
};

// Reads an artifact directory from local disk. Only text files of known types are kept;
// anything else is skipped and logged at debug level.
class ArtifactLoader {
public:
    explicit ArtifactLoader(const Config& config);

    // Throws ArtifactError when `dir` is not a readable directory.
    LoadedArtifact load(const std::string& dir) const;

    bool is_excluded_dir(const std::string& name) const;
    static bool has_allowed_type(const std::string& file_name);
    static bool has_binary_extension(const std::string& file_name);
    static bool looks_binary(const std::string& content);
private:
    long long max_file_bytes_;
    std::vector<std::string> exclude_dirs_;
};

extern const char* const kSkillDocument;

}
