#include "ScannerRegistry.h"
#include "Config.h"
#include "Logging.h"
#include "Report.h"
#include "ScanContext.h"
#include "../scanners/CapabilityScanner.h"
#include "../scanners/ManifestScanner.h"
#include "../scanners/PatternScanner.h"
#include <algorithm>

namespace skill_scan {

void ScannerRegistry::register_scanner(ScannerPtr scanner) {
    scanners_.push_back(std::move(scanner));
}

void ScannerRegistry::register_all_default() {
    register_scanner(std::make_unique<PatternScanner>());
    register_scanner(std::make_unique<ManifestScanner>());
    register_scanner(std::make_unique<CapabilityScanner>());
}

const std::vector<std::string>& default_scanner_names(){
    static const std::vector<std::string> names = {"patterns", "manifests", "capabilities"};
    return names;
}

void ScannerRegistry::run_all(const std::vector<ScannedFile>& files, ScanContext& context) {
    const auto& cfg = context.config;
    auto is_enabled = [&](const std::string& name){
        if(!cfg.enable_scanners.empty()) {
            bool found = std::find(cfg.enable_scanners.begin(), cfg.enable_scanners.end(), name)!=cfg.enable_scanners.end();
            if(!found) return false;
        }
        if(!cfg.disable_scanners.empty()) {
            if(std::find(cfg.disable_scanners.begin(), cfg.disable_scanners.end(), name)!=cfg.disable_scanners.end()) return false;
        }
        return true;
    };
    std::vector<Scanner*> active;
    for(auto& s : scanners_) {
        if(is_enabled(s->name())) active.push_back(s.get());
        else Logger::instance().debug("Scanner disabled: " + s->name());
    }
    for(const auto& file : files) {
        if(file.text.empty()) continue;
        Logger::instance().trace("Scanning file: " + file.path);
        for(auto* s : active) {
            try {
                s->scan(file, context);
            } catch(const std::exception& ex) {
                context.report.add_warning(s->name(), WarnCode::ScannerError, file.path + ":" + ex.what());
            }
        }
    }
}

}
