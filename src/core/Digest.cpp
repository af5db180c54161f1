#include "Digest.h"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace skill_scan {

static std::string evp_hex(const EVP_MD* md, const std::string& data){
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    unsigned char out[EVP_MAX_MD_SIZE]; unsigned int outlen = 0;
    if(EVP_DigestInit_ex(ctx.get(), md, nullptr)!=1 ||
       EVP_DigestUpdate(ctx.get(), data.data(), data.size())!=1 ||
       EVP_DigestFinal_ex(ctx.get(), out, &outlen)!=1){
        throw std::runtime_error("digest computation failed");
    }
    static const char* hx = "0123456789abcdef";
    std::string hex; hex.reserve(outlen*2);
    for(unsigned i=0;i<outlen;i++){ hex.push_back(hx[out[i]>>4]); hex.push_back(hx[out[i]&0xF]); }
    return hex;
}

std::string sha1_hex(const std::string& data){ return evp_hex(EVP_sha1(), data); }
std::string sha256_hex(const std::string& data){ return evp_hex(EVP_sha256(), data); }

std::string make_finding_id(const std::string& rule_id, const std::string& file_path,
                            std::optional<int> line_start, const std::string& evidence){
    std::string stable = rule_id + ":" + file_path + ":" + (line_start ? std::to_string(*line_start) : std::string("None")) + ":" + evidence;
    return rule_id + "_" + sha1_hex(stable).substr(0, 8);
}

std::string content_hash(const std::string& text){
    std::string normalized; normalized.reserve(text.size());
    for(size_t i=0;i<text.size();++i){
        if(text[i]=='\r'){
            normalized.push_back('\n');
            if(i+1<text.size() && text[i+1]=='\n') ++i;
        } else normalized.push_back(text[i]);
    }
    return sha256_hex(normalized);
}

}
