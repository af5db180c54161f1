#include "core/AnalysisRunner.h"
#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/OpenAIClient.h"
#include "core/RuleCatalog.h"
#include <fstream>
#include <iostream>
#include <memory>

using namespace skill_scan;

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    ConfigValidator validator;
    if(!validator.load_external_files(cfg)) return 2;
    if(!validator.validate(cfg)) return 2;
    Logger::instance().set_level(*log_level_from_string(cfg.log_level));

    std::unique_ptr<RuleCatalog> catalog;
    try {
        catalog = std::make_unique<RuleCatalog>(builtin_rule_definitions());
    } catch(const CatalogError& ex) {
        std::cerr << "Rule catalog error: " << ex.what() << "\n";
        return 3;
    }
    Logger::instance().debug("Rule catalog loaded: " + std::to_string(catalog->size()) + " rules");

    CurlGlobal curl;
    std::unique_ptr<OpenAIClient> client;
    if(cfg.validation_mode != ValidationMode::Off) client = std::make_unique<OpenAIClient>(cfg);

    AnalysisRunner runner(cfg, *catalog, client.get());
    auto outcomes = runner.run_batch(cfg.artifacts);

    JSONWriter writer;
    std::string json = writer.write(outcomes, cfg);
    if(cfg.output_file.empty()) {
        std::cout << json;
        if(json.empty() || json.back() != '\n') std::cout << '\n';
    } else {
        std::ofstream ofs(cfg.output_file);
        if(!ofs || !(ofs << json)) {
            std::cerr << "Failed to write output: " << cfg.output_file << "\n";
            return 2;
        }
    }

    int rc = 0;
    int thresh = severity_rank(cfg.fail_on_severity);
    for(const auto& o : outcomes) {
        if(!o.succeeded()) { rc = 1; continue; }
        if(thresh <= 0) continue;
        for(const auto& f : o.record->findings) {
            if(severity_rank_enum(f.severity) >= thresh) rc = 1;
        }
    }
    return rc;
}
