#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace skill_scan {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

std::optional<LogLevel> log_level_from_string(const std::string& s);

// Process-wide stderr logger. Output lines are serialized; level changes are atomic.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }

    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m) { log(LogLevel::Error, m); }
    void warn(const std::string& m) { log(LogLevel::Warn, m); }
    void info(const std::string& m) { log(LogLevel::Info, m); }
    void debug(const std::string& m) { log(LogLevel::Debug, m); }
    void trace(const std::string& m) { log(LogLevel::Trace, m); }
private:
    Logger() = default;
    const char* prefix(LogLevel lvl) const;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

}
