#pragma once
#include "Report.h"
#include "Scanner.h"
#include <vector>

namespace skill_scan {

struct Config;
class RuleCatalog;
class ScannerRegistry;

// Full deterministic pass over one artifact: default scanners, then scoring.
// Warnings raised along the way land in `report`.
ScanResult scan_security(const std::vector<ScannedFile>& files, const RuleCatalog& catalog,
                         const Config& config, Report& report);
// Same pass over a caller-populated registry.
ScanResult scan_security(const std::vector<ScannedFile>& files, ScannerRegistry& registry, const RuleCatalog& catalog,
                         const Config& config, Report& report);
// Default config, warnings discarded.
ScanResult scan_security(const std::vector<ScannedFile>& files, const RuleCatalog& catalog);

}
