#include "Config.h"
#include <algorithm>
#include <cctype>

namespace skill_scan {

static std::string lowered(std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); }); return s; }

std::string validation_mode_to_string(ValidationMode m){
    switch(m){
        case ValidationMode::Required: return "required";
        case ValidationMode::Degrade: return "degrade";
        case ValidationMode::Off: return "off";
    }
    return "required";
}

std::optional<ValidationMode> validation_mode_from_string(const std::string& s){
    std::string v = lowered(s);
    if(v=="required") return ValidationMode::Required;
    if(v=="degrade") return ValidationMode::Degrade;
    if(v=="off") return ValidationMode::Off;
    return std::nullopt;
}

int severity_rank(const std::string& sev){
    std::string s = lowered(sev);
    if(s=="low") return 1;
    if(s=="medium") return 2;
    if(s=="high") return 3;
    if(s=="critical") return 4;
    return 0;
}

}
