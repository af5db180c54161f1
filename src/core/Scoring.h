#pragma once
#include "Scanner.h"
#include <string>
#include <vector>

namespace skill_scan {

constexpr int kMaxRiskScore = 200;

// min(200, sum of severity weights)
int compute_risk_score(const std::vector<Finding>& findings);
std::string trust_badge(int risk_score);
// 0..100, higher is safer
int overall_score(int risk_score);

}
