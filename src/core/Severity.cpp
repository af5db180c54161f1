#include "Severity.h"
#include <algorithm>
#include <cctype>

namespace skill_scan {

static std::string lower(std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); }); return s; }

std::string severity_to_string(Severity s){
    switch(s){
        case Severity::Low: return "LOW";
        case Severity::Medium: return "MEDIUM";
        case Severity::High: return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "LOW";
}

std::optional<Severity> severity_from_string(const std::string& s){
    std::string v = lower(s);
    if(v=="low") return Severity::Low;
    if(v=="medium") return Severity::Medium;
    if(v=="high") return Severity::High;
    if(v=="critical") return Severity::Critical;
    return std::nullopt;
}

int severity_rank_enum(Severity s){ return static_cast<int>(s) + 1; }

int severity_weight(Severity s){
    switch(s){
        case Severity::Critical: return 100;
        case Severity::High: return 25;
        case Severity::Medium: return 5;
        case Severity::Low: return 1;
    }
    return 0;
}

std::string confidence_to_string(Confidence c){
    switch(c){
        case Confidence::Low: return "low";
        case Confidence::Medium: return "medium";
        case Confidence::High: return "high";
    }
    return "low";
}

std::optional<Confidence> confidence_from_string(const std::string& s){
    std::string v = lower(s);
    if(v=="low") return Confidence::Low;
    if(v=="medium") return Confidence::Medium;
    if(v=="high") return Confidence::High;
    return std::nullopt;
}

std::string category_to_string(Category c){
    switch(c){
        case Category::Exec: return "exec";
        case Category::Filesystem: return "filesystem";
        case Category::Network: return "network";
        case Category::Secrets: return "secrets";
        case Category::Deps: return "deps";
        case Category::PromptInjection: return "prompt_injection";
    }
    return "exec";
}

}
