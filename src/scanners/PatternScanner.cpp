#include "PatternScanner.h"
#include "../core/Digest.h"
#include "../core/Report.h"
#include "../core/RuleCatalog.h"
#include "../core/ScanContext.h"
#include "../core/Utils.h"
#include <iterator>
#include <re2/re2.h>

namespace skill_scan {

std::vector<RuleMatch> match_file(const RuleCatalog& catalog, const ScannedFile& file){
    std::vector<RuleMatch> out;
    if(file.text.empty()) return out;
    const std::string& text = file.text;
    const re2::StringPiece input(text);
    for(const auto& rule : catalog.rules()){
        if(!rule.applies_to(file.path)) continue;
        re2::StringPiece m;
        size_t pos = 0;
        while(rule.pattern->Match(input, pos, text.size(), re2::RE2::UNANCHORED, &m, 1)){
            size_t start = static_cast<size_t>(m.data() - text.data());
            size_t stop = start + m.size();
            size_t wb = utils::utf8_retreat(text, start, PatternScanner::kWindowBefore);
            size_t we = utils::utf8_advance(text, stop, PatternScanner::kWindowAfter);
            out.push_back(RuleMatch{&rule, file.path, start, stop, text.substr(wb, we-wb)});
            if(stop > start) pos = stop;
            else if(stop < text.size()) pos = utils::utf8_advance(text, stop, 1); // empty match
            else break;
        }
    }
    return out;
}

std::vector<RuleMatch> match(const RuleCatalog& catalog, const std::vector<ScannedFile>& files){
    std::vector<RuleMatch> all;
    for(const auto& f : files){
        auto part = match_file(catalog, f);
        all.insert(all.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return all;
}

Finding assemble_finding(const RuleMatch& m, const std::string& text){
    Finding f;
    auto line = utils::line_number(text, static_cast<long long>(m.match_start));
    f.evidence = utils::make_evidence(m.window);
    f.id = make_finding_id(m.rule->id, m.file_path, line, f.evidence);
    f.category = m.rule->category;
    f.severity = m.rule->severity;
    f.title = m.rule->title;
    f.file_path = m.file_path;
    f.line_start = line;
    f.line_end = line;
    f.confidence = m.rule->confidence;
    return f;
}

void PatternScanner::scan(const ScannedFile& file, ScanContext& context){
    for(const auto& m : match_file(context.catalog, file)){
        context.report.add_finding(assemble_finding(m, file.text));
    }
}

}
