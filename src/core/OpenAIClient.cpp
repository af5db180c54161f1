#include "OpenAIClient.h"
#include "Config.h"
#include "Logging.h"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>

namespace skill_scan {

namespace {

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata){
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlEasyDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
struct CurlSlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };

bool retryable(long status){ return status == 429 || status >= 500; }

}

CurlGlobal::CurlGlobal(){ curl_global_init(CURL_GLOBAL_DEFAULT); }
CurlGlobal::~CurlGlobal(){ curl_global_cleanup(); }

OpenAIClient::OpenAIClient(const Config& config)
    : endpoint_(config.validator_endpoint), api_key_env_(config.api_key_env),
      max_output_tokens_(config.max_output_tokens), attempts_(config.validator_attempts < 1 ? 1 : config.validator_attempts),
      backoff_ms_(config.validator_backoff_ms < 0 ? 0 : config.validator_backoff_ms) {}

long OpenAIClient::backoff_delay_ms(long base_ms, int attempt){
    if(base_ms <= 0) return 0;
    long delay = base_ms;
    for(int i = 1; i < attempt && delay < kMaxBackoffMs; ++i) delay *= 2;
    return std::min(delay, kMaxBackoffMs);
}

nlohmann::ordered_json OpenAIClient::build_body(const ValidatorCall& call) const {
    using ojson = nlohmann::ordered_json;
    ojson body;
    body["model"] = call.profile.model;
    body["input"] = ojson::array({
        {{"role", "system"}, {"content", ojson::array({{{"type", "text"}, {"text", call.system_instruction}}})}},
        {{"role", "user"}, {"content", ojson::array({{{"type", "text"}, {"text", call.user_payload.dump()}}})}},
    });
    body["max_output_tokens"] = max_output_tokens_;
    if(call.profile.reasoning_effort) body["reasoning"] = {{"effort", *call.profile.reasoning_effort}};
    ojson format = {{"type", "json_schema"}, {"name", "validated_security_output"}, {"strict", true}};
    format["schema"] = call.schema ? ojson::parse(call.schema->dump()) : ojson::object();
    body["text"] = {{"format", format}};
    return body;
}

TransportResult OpenAIClient::post(const std::string& body, const std::string& api_key, long timeout_ms) const {
    TransportResult res;
    for(int attempt = 1; attempt <= attempts_; ++attempt){
        res = TransportResult{};
        res.attempts = attempt;
        std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
        if(!curl){ res.error = "curl_easy_init failed"; return res; }
        curl_slist* raw = nullptr;
        raw = curl_slist_append(raw, "Content-Type: application/json");
        raw = curl_slist_append(raw, ("Authorization: Bearer " + api_key).c_str());
        std::unique_ptr<curl_slist, CurlSlistDeleter> headers(raw);

        curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &res.body);

        CURLcode rc = curl_easy_perform(curl.get());
        if(rc != CURLE_OK){
            res.error = curl_easy_strerror(rc);
        } else {
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.http_status);
            if(res.http_status >= 200 && res.http_status < 300){ res.ok = true; return res; }
            res.error = "HTTP " + std::to_string(res.http_status);
            if(!retryable(res.http_status)) return res;
        }
        if(attempt < attempts_){
            long delay = backoff_delay_ms(backoff_ms_, attempt);
            Logger::instance().warn("Validator attempt " + std::to_string(attempt) + " failed: " + res.error +
                                    "; retrying in " + std::to_string(delay) + " ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }
    return res;
}

nlohmann::json OpenAIClient::create_response(const ValidatorCall& call){
    const char* key = std::getenv(api_key_env_.c_str());
    if(!key || !*key) throw ValidationError(api_key_env_ + " must be set for validation");
    std::string body = build_body(call).dump();
    TransportResult res = post(body, key, call.timeout_ms);
    if(!res.ok){
        std::string msg = "validator request failed after " + std::to_string(res.attempts) + " attempt(s): " + res.error;
        if(!res.body.empty()) msg += ": " + res.body;
        throw ValidationError(msg);
    }
    auto envelope = nlohmann::json::parse(res.body, nullptr, /*allow_exceptions=*/false);
    if(envelope.is_discarded()) throw ValidationError("validator response body is not JSON");
    return envelope;
}

}
