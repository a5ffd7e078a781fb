#include "JsonUtil.h"
#include <cstdio>
#include <ctime>

namespace plug_scan {
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
    if(tp.time_since_epoch().count() == 0) return "";
    using namespace std::chrono;
    // guard against duration overflow for extreme time points
    auto secs = duration_cast<seconds>(tp.time_since_epoch()).count();
    if(secs < -62135596800LL || secs > 253402300799LL) return "";
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    if(!gmtime_r(&t, &tm)) return "";
    char buf[32];
    if(std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) return "";
    return buf;
}

std::string fixed1(double v){
    char buf[64]; std::snprintf(buf, sizeof(buf), "%.1f", v); return buf;
}

std::string format_duration(double seconds){
    if(seconds < 60) return fixed1(seconds) + "s";
    if(seconds < 3600) return fixed1(seconds/60.0) + "m";
    return fixed1(seconds/3600.0) + "h";
}

}
}
