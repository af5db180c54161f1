#include "Logging.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace skill_scan {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
}

std::optional<LogLevel> log_level_from_string(const std::string& s){
    std::string v = s; std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return std::tolower(c); });
    if(v=="error") return LogLevel::Error;
    if(v=="warn" || v=="warning") return LogLevel::Warn;
    if(v=="info") return LogLevel::Info;
    if(v=="debug") return LogLevel::Debug;
    if(v=="trace") return LogLevel::Trace;
    return std::nullopt;
}

const char* Logger::prefix(LogLevel lvl) const {
    switch(lvl){
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level())) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << prefix(lvl) << msg << '\n';
}

}
