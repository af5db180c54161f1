#pragma once
#include "Scanner.h"
#include <optional>
#include <string>
#include <vector>

namespace skill_scan {

struct Config;

struct ValidatorProfile {
    std::string model;
    std::optional<std::string> reasoning_effort;
    bool escalated = false; // true when the higher-capability model was chosen
};

// >=1 CRITICAL, or >=2 HIGH, or risk_score >= 20.
bool should_escalate(const std::vector<Finding>& findings, int risk_score);

// The higher-capability profile when a CRITICAL finding is not high confidence.
ValidatorProfile select_validator_profile(const std::vector<Finding>& findings, const Config& config);

}
