#pragma once
#include "Severity.h"
#include <re2/re2.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace skill_scan {

// Declarative rule row. Patterns are RE2 syntax, matched case-insensitively.
struct RuleDefinition {
    std::string id;
    Category category;
    Severity severity;
    std::string title;
    Confidence confidence;
    std::string pattern;
    std::vector<std::string> file_extensions; // empty = any extension
    std::string file_name_pattern;            // empty = any name
};

// Compiled, immutable rule.
struct Rule {
    std::string id;
    Category category;
    Severity severity;
    std::string title;
    Confidence confidence;
    std::string pattern_source;
    std::shared_ptr<const re2::RE2> pattern;
    std::vector<std::string> file_extensions;
    std::shared_ptr<const re2::RE2> file_name_regex; // null = any name

    // Lowercased path must end with a declared extension (when declared) and the path must
    // match the file name pattern (when declared).
    bool applies_to(const std::string& path) const;
};

class CatalogError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Read-only after construction; safe to share between worker threads.
class RuleCatalog {
public:
    // Compiles and validates every definition; throws CatalogError on the first bad one.
    explicit RuleCatalog(const std::vector<RuleDefinition>& definitions);

    const std::vector<Rule>& rules() const { return rules_; }
    const Rule* find(const std::string& id) const;
    size_t size() const { return rules_.size(); }
private:
    std::vector<Rule> rules_;
};

std::vector<RuleDefinition> builtin_rule_definitions();

// Ids of the rule-less structural checks run by the manifest scanner.
inline constexpr const char* kUnpinnedNpmRuleId = "SEC_DEP_UNPINNED_NPM_001";
inline constexpr const char* kUnpinnedPyRuleId = "SEC_DEP_UNPINNED_PY_001";

}
