#include "ConfigValidator.h"
#include "Logging.h"
#include "ScannerRegistry.h"
#include "Utils.h"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace skill_scan {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(!validate_severity(cfg.fail_on_severity, "--fail-on")) {
        return false;
    }
    cfg.fail_on_severity = utils::to_lower(utils::trim(cfg.fail_on_severity));
    if(!log_level_from_string(cfg.log_level)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(!validate_scanner_names(cfg.enable_scanners, "--enable") || !validate_scanner_names(cfg.disable_scanners, "--disable")) {
        return false;
    }
    for(const auto& scanner : cfg.enable_scanners) {
        if(std::find(cfg.disable_scanners.begin(), cfg.disable_scanners.end(), scanner) != cfg.disable_scanners.end()) {
            std::cerr << "Cannot enable and disable the same scanner: " << scanner << "\n";
            return false;
        }
    }

    if(cfg.max_file_bytes <= 0) {
        std::cerr << "--max-file-bytes must be positive\n";
        return false;
    }
    if(cfg.validator_timeout_ms <= 0) {
        std::cerr << "--validator-timeout-ms must be positive\n";
        return false;
    }
    if(cfg.validator_attempts < 1 || cfg.validator_attempts > 10) {
        std::cerr << "--validator-attempts must be between 1 and 10\n";
        return false;
    }
    if(cfg.validator_backoff_ms < 0 || cfg.validator_backoff_ms > 60000) {
        std::cerr << "--validator-backoff-ms must be between 0 and 60000\n";
        return false;
    }
    if(cfg.max_output_tokens <= 0) {
        std::cerr << "--max-output-tokens must be positive\n";
        return false;
    }
    if(cfg.parallel_max_threads < 0) {
        std::cerr << "--parallel-threads must not be negative\n";
        return false;
    }
    if(cfg.validation_mode != ValidationMode::Off) {
        if(cfg.validator_endpoint.empty() || cfg.default_model.empty() || cfg.escalated_model.empty()) {
            std::cerr << "Validator endpoint and model names must not be empty unless --validation off\n";
            return false;
        }
        if(cfg.api_key_env.empty()) {
            std::cerr << "--api-key-env must name an environment variable\n";
            return false;
        }
    }

    if(cfg.artifacts.empty()) {
        std::cerr << "No artifact directories given\n";
        return false;
    }
    return true;
}

bool ConfigValidator::load_external_files(Config& cfg) {
    if(cfg.artifacts_file.empty()) return true;
    return load_artifact_list(cfg);
}

bool ConfigValidator::validate_severity(const std::string& severity, const std::string& flag_name) {
    std::string trimmed = utils::trim(severity);
    if(trimmed.empty()) return true;
    std::string lower_severity = utils::to_lower(trimmed);
    if(std::find(allowed_severities_.begin(), allowed_severities_.end(), lower_severity) == allowed_severities_.end()) {
        std::cerr << "Invalid " << flag_name << " value: " << severity << "\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_scanner_names(const std::vector<std::string>& names, const std::string& flag_name) {
    const auto& known = default_scanner_names();
    for(const auto& name : names) {
        if(std::find(known.begin(), known.end(), name) == known.end()) {
            std::cerr << "Unknown scanner for " << flag_name << ": " << name << "\n";
            return false;
        }
    }
    return true;
}

bool ConfigValidator::load_artifact_list(Config& cfg) {
    std::ifstream af(cfg.artifacts_file);
    if(!af) {
        std::cerr << "Failed to open artifacts file: " << cfg.artifacts_file << "\n";
        return false;
    }
    std::string line;
    size_t added = 0;
    while(std::getline(af, line)) {
        line = utils::trim(line);
        if(line.empty()) continue;
        if(line[0] == '#') continue; // Skip comments
        cfg.artifacts.push_back(line);
        ++added;
    }
    Logger::instance().debug("Loaded " + std::to_string(added) + " artifacts from " + cfg.artifacts_file);
    return true;
}

}
