#pragma once
#include <string>
#include <optional>

namespace skill_scan {

enum class Severity { Low, Medium, High, Critical };
enum class Confidence { Low, Medium, High };
enum class Category { Exec, Filesystem, Network, Secrets, Deps, PromptInjection };

// "LOW" | "MEDIUM" | "HIGH" | "CRITICAL"
std::string severity_to_string(Severity s);
std::optional<Severity> severity_from_string(const std::string& s); // case-insensitive
int severity_rank_enum(Severity s);
// Scoring weight: CRITICAL=100, HIGH=25, MEDIUM=5, LOW=1
int severity_weight(Severity s);

std::string confidence_to_string(Confidence c);
std::optional<Confidence> confidence_from_string(const std::string& s);

std::string category_to_string(Category c);

}
