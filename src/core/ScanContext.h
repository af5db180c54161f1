#pragma once

namespace skill_scan {

struct Config;
class Report;
class RuleCatalog;

struct ScanContext {
    ScanContext(const Config& cfg, const RuleCatalog& rules, Report& rep)
        : config(cfg), catalog(rules), report(rep) {}

    const Config& config;
    const RuleCatalog& catalog;
    Report& report;
};

}
