#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace skill_scan {

// Table-driven command line parser. Non-flag arguments are artifact directories.
class ArgumentParser {
public:
    ArgumentParser();

    // false when the program should stop: --help/--version (exit_code 0) or a usage error (exit_code 2).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }
    const std::string& error() const { return error_; }

    void print_help() const;
    static void print_version();
private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<bool(const std::string&, Config&)> apply;
    };

    bool fail(const std::string& msg);

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    std::string error_;
};

}
