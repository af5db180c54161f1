#pragma once
#include "Scanner.h"
#include <vector>

namespace skill_scan {

class ScannerRegistry {
public:
    void register_scanner(ScannerPtr scanner);
    // patterns, manifests, capabilities; the order fixes finding order within a file
    void register_all_default();
    // Files in supplied order, each visited by every enabled scanner in registration order.
    void run_all(const std::vector<ScannedFile>& files, ScanContext& context);
    size_t size() const { return scanners_.size(); }
private:
    std::vector<ScannerPtr> scanners_;
};

const std::vector<std::string>& default_scanner_names();

}
