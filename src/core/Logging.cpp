#include "Logging.h"
#include "JsonUtil.h"
#include <iostream>
#include <algorithm>
#include <chrono>

namespace plug_scan {

Logger& Logger::instance(){
    static Logger inst;
    return inst;
}

const char* Logger::prefix(LogLevel lvl) const {
    switch(lvl){
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(!enabled(lvl)) return;
    std::string ts = jsonutil::time_to_iso(std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << ts << ' ' << prefix(lvl) << msg << '\n';
}

bool parse_log_level(const std::string& s, LogLevel& out){
    std::string v = s; std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if(v=="error") { out = LogLevel::Error; return true; }
    if(v=="warn" || v=="warning") { out = LogLevel::Warn; return true; }
    if(v=="info") { out = LogLevel::Info; return true; }
    if(v=="debug") { out = LogLevel::Debug; return true; }
    if(v=="trace") { out = LogLevel::Trace; return true; }
    return false;
}

}
