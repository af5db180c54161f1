#pragma once
#include <chrono>
#include <string>

namespace skill_scan {
namespace jsonutil {

// JSON string-body escaping; control characters become \u00XX.
std::string escape(const std::string& s);
// UTC "YYYY-MM-DDTHH:MM:SSZ"; empty string for the epoch or an unrepresentable time.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
