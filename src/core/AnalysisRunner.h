#pragma once
#include "ArtifactLoader.h"
#include "Report.h"
#include "ResultAssembler.h"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skill_scan {

struct Config;
class RuleCatalog;
class ScannerRegistry;
class ValidatorClient;

enum class OutcomeStatus { Succeeded, Failed };
const char* outcome_status_to_string(OutcomeStatus s);

struct AnalysisOutcome {
    std::string artifact;
    OutcomeStatus status = OutcomeStatus::Failed;
    std::string error_message; // failed units only, at most 1000 chars
    std::optional<AnalysisRecord> record; // succeeded units only
    std::vector<ScanWarning> warnings;
    bool succeeded() const { return status == OutcomeStatus::Succeeded; }
};

constexpr size_t kMaxErrorMessageChars = 1000;
std::string truncate_error_message(const std::string& msg);

// One unit of work per artifact: scan, escalate when needed, validate, assemble.
// The catalog and validator client are shared read-only between workers.
class AnalysisRunner {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    // Populates the per-unit registry; defaults to register_all_default().
    using RegistrySetup = std::function<void(ScannerRegistry&)>;

    // `validator` may be null; escalated units then fail unless validation is degraded or off.
    AnalysisRunner(const Config& config, const RuleCatalog& catalog, ValidatorClient* validator);

    AnalysisOutcome analyze_files(const std::string& artifact, const std::vector<ScannedFile>& files,
                                  const std::string& skill_text) const;
    // Loads the directory first; a load failure fails the unit.
    AnalysisOutcome analyze(const std::string& artifact_dir) const;
    // Outcomes in input order. Runs on worker threads when Config::parallel is set.
    std::vector<AnalysisOutcome> run_batch(const std::vector<std::string>& artifact_dirs) const;

    void set_clock(Clock clock) { clock_ = std::move(clock); }
    void set_registry_setup(RegistrySetup setup) { registry_setup_ = std::move(setup); }
    size_t worker_count(size_t jobs) const;
private:
    const Config& config_;
    const RuleCatalog& catalog_;
    ValidatorClient* validator_;
    ArtifactLoader loader_;
    Clock clock_;
    RegistrySetup registry_setup_;
};

}
