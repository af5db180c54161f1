#include "Utils.h"
#include <algorithm>
#include <cctype>

namespace skill_scan {
namespace utils {

static inline bool is_space(unsigned char c){ return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\v' || c=='\f'; }
static inline bool is_cont(unsigned char c){ return (c & 0xC0) == 0x80; }

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size()-suffix.size(), suffix.size(), suffix)==0;
}

bool starts_with(const std::string& s, const std::string& prefix){
    return s.rfind(prefix, 0) == 0;
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b<e && is_space(static_cast<unsigned char>(s[b]))) ++b;
    while(e>b && is_space(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e-b);
}

std::string collapse_whitespace(const std::string& s){
    std::string out; out.reserve(s.size());
    bool pending_space = false;
    for(char ch : s){
        if(is_space(static_cast<unsigned char>(ch))){ pending_space = !out.empty(); continue; }
        if(pending_space){ out.push_back(' '); pending_space = false; }
        out.push_back(ch);
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& s){
    std::vector<std::string> lines;
    std::string cur;
    for(size_t i=0;i<s.size();++i){
        char c = s[i];
        if(c=='\n' || c=='\r'){
            lines.push_back(cur); cur.clear();
            if(c=='\r' && i+1<s.size() && s[i+1]=='\n') ++i;
        } else cur.push_back(c);
    }
    if(!cur.empty()) lines.push_back(cur);
    return lines;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

size_t utf8_length(const std::string& s){
    size_t n = 0;
    for(unsigned char c : s) if(!is_cont(c)) ++n;
    return n;
}

std::string utf8_prefix(const std::string& s, size_t max_chars){
    return s.substr(0, utf8_advance(s, 0, max_chars));
}

size_t utf8_retreat(const std::string& s, size_t pos, size_t n){
    pos = std::min(pos, s.size());
    while(n>0 && pos>0){
        --pos;
        while(pos>0 && is_cont(static_cast<unsigned char>(s[pos]))) --pos;
        --n;
    }
    return pos;
}

size_t utf8_advance(const std::string& s, size_t pos, size_t n){
    while(n>0 && pos<s.size()){
        ++pos;
        while(pos<s.size() && is_cont(static_cast<unsigned char>(s[pos]))) ++pos;
        --n;
    }
    return std::min(pos, s.size());
}

std::string sanitize_utf8(const std::string& raw){
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out; out.reserve(raw.size());
    size_t i = 0;
    while(i < raw.size()){
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if(c < 0x80){ out.push_back(raw[i]); ++i; continue; }
        // sequence length and the allowed range of the second byte (maximal subpart rule)
        size_t len = 0; unsigned char lo = 0x80, hi = 0xBF;
        if(c >= 0xC2 && c <= 0xDF) len = 2;
        else if(c >= 0xE0 && c <= 0xEF){ len = 3; if(c == 0xE0) lo = 0xA0; else if(c == 0xED) hi = 0x9F; }
        else if(c >= 0xF0 && c <= 0xF4){ len = 4; if(c == 0xF0) lo = 0x90; else if(c == 0xF4) hi = 0x8F; }
        if(len == 0){ out += kReplacement; ++i; continue; }
        size_t j = 1;
        for(; j<len && i+j<raw.size(); ++j){
            unsigned char cc = static_cast<unsigned char>(raw[i+j]);
            unsigned char l = (j == 1) ? lo : 0x80, h = (j == 1) ? hi : 0xBF;
            if(cc < l || cc > h) break;
        }
        if(j == len){ out.append(raw, i, len); i += len; }
        else { out += kReplacement; i += j; }
    }
    return out;
}

std::optional<int> line_number(const std::string& text, long long offset){
    if(offset < 0 || static_cast<unsigned long long>(offset) > text.size()) return std::nullopt;
    auto end = text.begin() + static_cast<std::ptrdiff_t>(offset);
    return static_cast<int>(std::count(text.begin(), end, '\n')) + 1;
}

std::string make_evidence(const std::string& window){
    return utf8_prefix(collapse_whitespace(window), kEvidenceMaxChars);
}

}
}
