#include "Scoring.h"
#include <algorithm>

namespace skill_scan {

int compute_risk_score(const std::vector<Finding>& findings){
    long long total = 0;
    for(const auto& f : findings){
        total += severity_weight(f.severity);
        if(total >= kMaxRiskScore) return kMaxRiskScore;
    }
    return static_cast<int>(total);
}

std::string trust_badge(int risk_score){
    if(risk_score >= 100) return "Not Recommended";
    if(risk_score >= 50) return "Use With Caution";
    if(risk_score >= 20) return "Review Recommended";
    if(risk_score >= 5) return "Generally Safe";
    return "Verified Safe";
}

int overall_score(int risk_score){
    return std::max(0, 100 - std::min(risk_score, 100));
}

}
