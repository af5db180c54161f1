#pragma once
#include <string>
#include <vector>

namespace skill_scan {

struct Config;
struct AnalysisOutcome;
struct AnalysisRecord;

// Canonical JSON: object keys sorted, no insignificant whitespace unless pretty output is requested.
// SKILL_SCAN_CANON_TIME_ZERO blanks analyzed_at for byte-stable output.
class JSONWriter {
public:
    // Run outcome envelope: schema, meta, results, summary.
    std::string write(const std::vector<AnalysisOutcome>& outcomes, const Config& cfg) const;
    // Security payload of one artifact, as persisted.
    std::string write_record(const AnalysisRecord& record) const;
};

extern const char* const kOutcomeSchema;

}
