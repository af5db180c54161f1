#include "ValidationSchema.h"
#include "Validator.h"
#include <set>

namespace skill_scan {

const nlohmann::json& validated_security_schema(){
    static const nlohmann::json schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "validated_findings": {
                "type": "array",
                "items": {
                    "type": "object",
                    "properties": {
                        "finding_id": {"type": "string"},
                        "is_true_positive": {"type": "boolean"},
                        "final_severity": {"type": "string", "enum": ["LOW", "MEDIUM", "HIGH", "CRITICAL"]},
                        "reason": {"type": "string"},
                        "mitigation": {"type": "array", "items": {"type": "string"}}
                    },
                    "required": ["finding_id", "is_true_positive", "final_severity", "reason", "mitigation"],
                    "additionalProperties": false
                }
            },
            "security_summary": {"type": "string"}
        },
        "required": ["validated_findings", "security_summary"],
        "additionalProperties": false
    })");
    return schema;
}

namespace {

nlohmann::json parse_text_payload(const std::string& text){
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if(parsed.is_discarded()) throw ValidationError("validator output is not valid JSON");
    return parsed;
}

void require_only_keys(const nlohmann::json& obj, const std::set<std::string>& allowed, const std::string& where){
    for(auto it = obj.begin(); it != obj.end(); ++it){
        if(!allowed.count(it.key())) throw ValidationError(where + ": unexpected property '" + it.key() + "'");
    }
    for(const auto& k : allowed){
        if(!obj.contains(k)) throw ValidationError(where + ": missing required property '" + k + "'");
    }
}

const nlohmann::json& field(const nlohmann::json& obj, const char* key, nlohmann::json::value_t type, const std::string& where){
    const auto& v = obj.at(key);
    if(v.type() != type) throw ValidationError(where + "." + key + ": unexpected type " + v.type_name());
    return v;
}

ValidatedFinding parse_finding(const nlohmann::json& item, const std::string& where){
    using vt = nlohmann::json::value_t;
    if(!item.is_object()) throw ValidationError(where + ": expected object");
    require_only_keys(item, {"finding_id", "is_true_positive", "final_severity", "reason", "mitigation"}, where);
    ValidatedFinding vf;
    vf.finding_id = field(item, "finding_id", vt::string, where).get<std::string>();
    vf.is_true_positive = field(item, "is_true_positive", vt::boolean, where).get<bool>();
    std::string sev = field(item, "final_severity", vt::string, where).get<std::string>();
    // the enum is case-sensitive
    if(sev!="LOW" && sev!="MEDIUM" && sev!="HIGH" && sev!="CRITICAL")
        throw ValidationError(where + ".final_severity: '" + sev + "' is not a severity");
    vf.final_severity = *severity_from_string(sev);
    vf.reason = field(item, "reason", vt::string, where).get<std::string>();
    const auto& mit = field(item, "mitigation", vt::array, where);
    for(size_t i=0;i<mit.size();++i){
        if(!mit[i].is_string()) throw ValidationError(where + ".mitigation[" + std::to_string(i) + "]: expected string");
        vf.mitigation.push_back(mit[i].get<std::string>());
    }
    return vf;
}

}

nlohmann::json extract_payload(const nlohmann::json& envelope){
    if(!envelope.is_object()) throw ValidationError("validator response is not a JSON object");
    auto out = envelope.find("output");
    if(out != envelope.end() && out->is_array()){
        for(const auto& item : *out){
            if(!item.is_object()) continue;
            auto content = item.find("content");
            if(content == item.end() || !content->is_array()) continue;
            for(const auto& entry : *content){
                if(!entry.is_object()) continue;
                auto type_it = entry.find("type");
                if(type_it == entry.end() || !type_it->is_string()) continue;
                const auto& type = type_it->get_ref<const std::string&>();
                if(type == "output_text" || type == "text"){
                    auto text = entry.find("text");
                    if(text != entry.end() && text->is_string()) return parse_text_payload(text->get<std::string>());
                }
                if(type == "output_json"){
                    auto js = entry.find("json");
                    if(js != entry.end() && js->is_object()) return *js;
                }
            }
        }
    }
    auto flat = envelope.find("output_text");
    if(flat != envelope.end() && flat->is_string()) return parse_text_payload(flat->get<std::string>());
    throw ValidationError("validator response did not contain parseable JSON output");
}

ValidatedSecurity parse_validated_security(const nlohmann::json& payload){
    using vt = nlohmann::json::value_t;
    if(!payload.is_object()) throw ValidationError("validated output: expected object");
    require_only_keys(payload, {"validated_findings", "security_summary"}, "validated output");
    ValidatedSecurity vs;
    const auto& items = field(payload, "validated_findings", vt::array, "validated output");
    for(size_t i=0;i<items.size();++i){
        vs.validated_findings.push_back(parse_finding(items[i], "validated_findings[" + std::to_string(i) + "]"));
    }
    vs.security_summary = field(payload, "security_summary", vt::string, "validated output").get<std::string>();
    return vs;
}

}
