#include "core/ValidationSchema.h"
#include "core/Validator.h"
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);
    auto envelope = nlohmann::json::parse(input, nullptr, /*allow_exceptions=*/false);
    if (envelope.is_discarded()) return 0;
    try {
        skill_scan::parse_validated_security(skill_scan::extract_payload(envelope));
    } catch (const skill_scan::ValidationError&) {
        // rejected output is the expected outcome for most inputs
    }
    return 0;
}
