#include "SecurityScanner.h"
#include "Config.h"
#include "Logging.h"
#include "ScanContext.h"
#include "ScannerRegistry.h"
#include "Scoring.h"

namespace skill_scan {

ScanResult scan_security(const std::vector<ScannedFile>& files, const RuleCatalog& catalog,
                         const Config& config, Report& report){
    ScannerRegistry registry;
    registry.register_all_default();
    return scan_security(files, registry, catalog, config, report);
}

ScanResult scan_security(const std::vector<ScannedFile>& files, ScannerRegistry& registry, const RuleCatalog& catalog,
                         const Config& config, Report& report){
    ScanContext context(config, catalog, report);
    registry.run_all(files, context);

    ScanResult result;
    result.findings = report.findings();
    result.capabilities = report.capabilities();
    result.risk_score = compute_risk_score(result.findings);
    result.trust_badge = trust_badge(result.risk_score);
    Logger::instance().debug("Scanned " + std::to_string(files.size()) + " files: " + std::to_string(result.findings.size()) +
                             " findings, risk " + std::to_string(result.risk_score));
    return result;
}

ScanResult scan_security(const std::vector<ScannedFile>& files, const RuleCatalog& catalog){
    Config cfg;
    Report report;
    return scan_security(files, catalog, cfg, report);
}

}
