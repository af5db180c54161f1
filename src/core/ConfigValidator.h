#pragma once
#include "Config.h"
#include <string>
#include <vector>

namespace skill_scan {

// Post-parse checks and normalization. Problems are reported on stderr; false means exit code 2.
class ConfigValidator {
public:
    bool validate(Config& cfg);
    // Appends the entries of --artifacts-file to cfg.artifacts.
    bool load_external_files(Config& cfg);

    bool validate_severity(const std::string& severity, const std::string& flag_name);
    bool validate_scanner_names(const std::vector<std::string>& names, const std::string& flag_name);
private:
    bool load_artifact_list(Config& cfg);

    std::vector<std::string> allowed_severities_ = {"low", "medium", "high", "critical"};
};

}
