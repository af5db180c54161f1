#include "core/RuleCatalog.h"
#include "core/SecurityScanner.h"
#include "core/Utils.h"
#include <cstdint>
#include <string>
#include <vector>

// First byte picks the file name so every rule gate is reachable; the rest is file text.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static const char* names[] = {"SKILL.md", "run.py", "index.js", "install.sh", "package.json",
                                  "requirements.txt", "config.yaml", "Dockerfile"};
    static const skill_scan::RuleCatalog catalog(skill_scan::builtin_rule_definitions());
    if (size == 0) return 0;

    std::string name = names[data[0] % (sizeof(names) / sizeof(names[0]))];
    std::string raw(reinterpret_cast<const char*>(data + 1), size - 1);
    std::vector<skill_scan::ScannedFile> files{{name, skill_scan::utils::sanitize_utf8(raw)}};

    auto result = skill_scan::scan_security(files, catalog);
    if (result.risk_score < 0 || result.risk_score > 200) __builtin_trap();
    for (const auto& f : result.findings) {
        if (skill_scan::utils::utf8_length(f.evidence) > skill_scan::utils::kEvidenceMaxChars) __builtin_trap();
    }
    return 0;
}
