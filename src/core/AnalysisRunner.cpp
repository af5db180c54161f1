#include "AnalysisRunner.h"
#include "Config.h"
#include "Digest.h"
#include "Escalation.h"
#include "Logging.h"
#include "ScannerRegistry.h"
#include "SecurityScanner.h"
#include "Utils.h"
#include "ValidationOrchestrator.h"
#include "Validator.h"
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

namespace skill_scan {

const char* outcome_status_to_string(OutcomeStatus s){
    return s == OutcomeStatus::Succeeded ? "succeeded" : "failed";
}

std::string truncate_error_message(const std::string& msg){
    return utils::utf8_prefix(msg, kMaxErrorMessageChars);
}

AnalysisRunner::AnalysisRunner(const Config& config, const RuleCatalog& catalog, ValidatorClient* validator)
    : config_(config), catalog_(catalog), validator_(validator), loader_(config),
      clock_([]{ return std::chrono::system_clock::now(); }),
      registry_setup_([](ScannerRegistry& registry){ registry.register_all_default(); }) {}

AnalysisOutcome AnalysisRunner::analyze_files(const std::string& artifact, const std::vector<ScannedFile>& files,
                                              const std::string& skill_text) const {
    auto& log = Logger::instance();
    AnalysisOutcome outcome;
    outcome.artifact = artifact;
    try {
        Report report;
        ScannerRegistry registry;
        registry_setup_(registry);
        ScanResult scan = scan_security(files, registry, catalog_, config_, report);
        outcome.warnings = report.warnings();
        // a partially scanned artifact is never scored
        if(const ScanWarning* err = report.first_scanner_error())
            throw std::runtime_error("scanner " + err->scanner + " failed on " + err->detail);

        std::optional<ValidatedSecurity> validation;
        std::optional<std::string> llm_model;
        if(config_.validation_mode != ValidationMode::Off && should_escalate(scan.findings, scan.risk_score)){
            ValidatorProfile profile = select_validator_profile(scan.findings, config_);
            log.info(artifact + ": escalating " + std::to_string(scan.findings.size()) + " findings to " + profile.model);
            try {
                if(!validator_) throw ValidationError("no validator client configured");
                ValidationOrchestrator orchestrator(*validator_, config_);
                validation = orchestrator.validate(scan.findings, scan.risk_score, files, profile);
                llm_model = profile.model;
            } catch(const ValidationError& ex) {
                if(config_.validation_mode != ValidationMode::Degrade) throw;
                log.warn(artifact + ": validation failed, keeping deterministic result: " + ex.what());
            }
        }

        AnalysisRecord rec = assemble_record(scan, validation, llm_model, clock_());
        rec.content_hash = content_hash(skill_text);
        outcome.record = std::move(rec);
        outcome.status = OutcomeStatus::Succeeded;
    } catch(const std::exception& ex) {
        outcome.status = OutcomeStatus::Failed;
        outcome.error_message = truncate_error_message(ex.what());
        outcome.record.reset();
        log.error(artifact + ": analysis failed: " + outcome.error_message);
    }
    return outcome;
}

AnalysisOutcome AnalysisRunner::analyze(const std::string& artifact_dir) const {
    LoadedArtifact art;
    try {
        art = loader_.load(artifact_dir);
    } catch(const std::exception& ex) {
        AnalysisOutcome outcome;
        outcome.artifact = artifact_dir;
        outcome.error_message = truncate_error_message(ex.what());
        Logger::instance().error(artifact_dir + ": " + outcome.error_message);
        return outcome;
    }
    return analyze_files(artifact_dir, art.files, art.skill_text);
}

size_t AnalysisRunner::worker_count(size_t jobs) const {
    if(!config_.parallel || jobs < 2) return 1;
    size_t n = config_.parallel_max_threads > 0 ? static_cast<size_t>(config_.parallel_max_threads)
                                                : std::max(1u, std::thread::hardware_concurrency());
    return std::min(n, jobs);
}

std::vector<AnalysisOutcome> AnalysisRunner::run_batch(const std::vector<std::string>& artifact_dirs) const {
    std::vector<AnalysisOutcome> outcomes(artifact_dirs.size());
    size_t workers = worker_count(artifact_dirs.size());
    if(workers <= 1){
        for(size_t i=0;i<artifact_dirs.size();++i) outcomes[i] = analyze(artifact_dirs[i]);
        return outcomes;
    }
    Logger::instance().debug("Running " + std::to_string(artifact_dirs.size()) + " artifacts on " + std::to_string(workers) + " workers");
    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for(size_t w=0; w<workers; ++w){
        pool.emplace_back([&]{
            for(size_t i = next.fetch_add(1); i < artifact_dirs.size(); i = next.fetch_add(1)){
                outcomes[i] = analyze(artifact_dirs[i]);
            }
        });
    }
    for(auto& t : pool) t.join();
    return outcomes;
}

}
