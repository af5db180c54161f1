#include "Report.h"
#include "Logging.h"

namespace skill_scan {

const char* warn_code_to_string(WarnCode code){
    switch(code){
        case WarnCode::ManifestUnparseable: return "manifest_unparseable";
        case WarnCode::ScannerError: return "scanner_error";
    }
    return "unknown";
}

void Report::add_finding(Finding finding) {
    findings_.push_back(std::move(finding));
}

void Report::raise_capability(Capability c) {
    capabilities_.raise(c);
}

void Report::add_warning(const std::string& scanner, WarnCode code, const std::string& detail){
    Logger::instance().debug(scanner + ": " + warn_code_to_string(code) + (detail.empty() ? "" : ":" + detail));
    warnings_.push_back(ScanWarning{scanner, code, detail});
}

const ScanWarning* Report::first_scanner_error() const {
    for(const auto& w : warnings_) if(w.code == WarnCode::ScannerError) return &w;
    return nullptr;
}

}
