#pragma once
#include "../core/Scanner.h"
#include <vector>

namespace skill_scan {

// Structural dependency checks for npm manifests and pip requirements lists.
class ManifestScanner : public Scanner {
public:
    std::string name() const override { return "manifests"; }
    std::string description() const override { return "Flags unpinned dependencies in package manifests"; }
    void scan(const ScannedFile& file, ScanContext& context) override;

    static bool is_npm_manifest(const std::string& path);
    static bool is_requirements_file(const std::string& path);

    // Unparseable JSON or a non-object root yields no findings. *parsed is false only for unparseable JSON.
    static std::vector<Finding> check_npm_manifest(const ScannedFile& file, bool* parsed = nullptr);
    static std::vector<Finding> check_requirements(const ScannedFile& file);

    static bool is_unpinned_npm_version(const std::string& version);
};

}
