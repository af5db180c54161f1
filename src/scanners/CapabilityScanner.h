#pragma once
#include "../core/Scanner.h"
#include <vector>

namespace skill_scan {

// Coarse behavioral tagging, matched case-insensitively. Over-approximates the rule catalog
// and never produces findings.
class CapabilityScanner : public Scanner {
public:
    std::string name() const override { return "capabilities"; }
    std::string description() const override { return "Infers network/file/shell/env/db capabilities"; }
    void scan(const ScannedFile& file, ScanContext& context) override;

    // Flags raised by a single file.
    static CapabilityFlags detect(const std::string& text);
};

// OR of detect() over every file.
CapabilityFlags detect_capabilities(const std::vector<ScannedFile>& files);

}
