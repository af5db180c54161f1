#pragma once
#include "Scanner.h"

namespace skill_scan {

enum class WarnCode { ManifestUnparseable, ScannerError };

const char* warn_code_to_string(WarnCode code);

struct ScanWarning {
    std::string scanner;
    WarnCode code;
    std::string detail;
};

// Accumulates the output of one artifact scan. Not shared between scans.
class Report {
public:
    void add_finding(Finding finding);
    void raise_capability(Capability c);
    void add_warning(const std::string& scanner, WarnCode code, const std::string& detail);

    const std::vector<Finding>& findings() const { return findings_; }
    const CapabilityFlags& capabilities() const { return capabilities_; }
    const std::vector<ScanWarning>& warnings() const { return warnings_; }
    // First warning that means a scanner did not finish a file; null when the scan is complete.
    const ScanWarning* first_scanner_error() const;
private:
    std::vector<Finding> findings_;
    CapabilityFlags capabilities_;
    std::vector<ScanWarning> warnings_;
};

}
