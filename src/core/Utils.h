#pragma once
#include <optional>
#include <string>
#include <vector>

namespace skill_scan {
namespace utils {

std::string to_lower(std::string s);
bool ends_with(const std::string& s, const std::string& suffix);
bool starts_with(const std::string& s, const std::string& prefix);
std::string trim(const std::string& s);
// Splits on runs of whitespace and re-joins with single spaces (leading/trailing dropped).
std::string collapse_whitespace(const std::string& s);
// Lines split on \n, \r\n and \r; a trailing terminator does not produce an empty last line.
std::vector<std::string> split_lines(const std::string& s);
std::vector<std::string> split_csv(const std::string& s);

// UTF-8 helpers. Offsets are byte offsets; counts are code points.
size_t utf8_length(const std::string& s);
std::string utf8_prefix(const std::string& s, size_t max_chars);
size_t utf8_retreat(const std::string& s, size_t pos, size_t n);
size_t utf8_advance(const std::string& s, size_t pos, size_t n);
// Replaces every invalid sequence with U+FFFD.
std::string sanitize_utf8(const std::string& raw);

// 1-based line of byte offset; nullopt when the offset is outside the text.
std::optional<int> line_number(const std::string& text, long long offset);

constexpr size_t kEvidenceMaxChars = 240;
std::string make_evidence(const std::string& window);

}
}
