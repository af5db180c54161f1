#include "Escalation.h"
#include "Config.h"

namespace skill_scan {

bool should_escalate(const std::vector<Finding>& findings, int risk_score){
    int high = 0;
    for(const auto& f : findings){
        if(f.severity == Severity::Critical) return true;
        if(f.severity == Severity::High) ++high;
    }
    return high >= 2 || risk_score >= 20;
}

ValidatorProfile select_validator_profile(const std::vector<Finding>& findings, const Config& config){
    for(const auto& f : findings){
        if(f.severity == Severity::Critical && f.confidence != Confidence::High){
            ValidatorProfile p{config.escalated_model, std::nullopt, true};
            if(!config.escalated_effort.empty()) p.reasoning_effort = config.escalated_effort;
            return p;
        }
    }
    return ValidatorProfile{config.default_model, std::nullopt, false};
}

}
