#include "JsonUtil.h"
#include <cstdio>
#include <ctime>

namespace skill_scan {
namespace jsonutil {

std::string escape(const std::string& s){
    std::string out; out.reserve(s.size()+8);
    for(char ch : s){
        unsigned char c = static_cast<unsigned char>(ch);
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20){ char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", c); out += buf; }
                else out.push_back(ch);
        }
    }
    return out;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    if(tp.time_since_epoch().count()==0) return "";
    using namespace std::chrono;
    auto secs = duration_cast<seconds>(tp.time_since_epoch()).count();
    // Outside the range gmtime_r can represent
    if(secs < -62135596800LL || secs > 253402300799LL) return "";
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    if(!gmtime_r(&t, &tm)) return "";
    char buf[32];
    if(std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) != 20) return "";
    return buf;
}

}
}
