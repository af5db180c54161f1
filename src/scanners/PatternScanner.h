#pragma once
#include "../core/Scanner.h"
#include <vector>

namespace skill_scan {

struct Rule;
class RuleCatalog;

// One occurrence of a catalog rule in a file.
struct RuleMatch {
    const Rule* rule = nullptr;
    std::string file_path;
    size_t match_start = 0; // byte offsets into the file text
    size_t match_end = 0;
    std::string window;     // raw text: 50 chars before .. 120 chars after
};

// All non-overlapping occurrences of every applicable rule, catalog order then discovery order.
// Matching runs in time linear in the text length, so long single-line files are safe.
std::vector<RuleMatch> match_file(const RuleCatalog& catalog, const ScannedFile& file);
std::vector<RuleMatch> match(const RuleCatalog& catalog, const std::vector<ScannedFile>& files);

Finding assemble_finding(const RuleMatch& m, const std::string& text);

class PatternScanner : public Scanner {
public:
    std::string name() const override { return "patterns"; }
    std::string description() const override { return "Matches catalog rules against file text"; }
    void scan(const ScannedFile& file, ScanContext& context) override;

    static constexpr size_t kWindowBefore = 50;
    static constexpr size_t kWindowAfter = 120;
};

}
