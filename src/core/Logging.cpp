#include "Logging.h"
#include "Utils.h"
#include <iostream>
#include <chrono>

namespace ioc_sweep {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
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
    if(static_cast<int>(lvl) > static_cast<int>(level_)) return;
    std::string ts = utils::time_to_iso(std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << ts << ' ' << prefix(lvl) << msg << '\n';
}

bool parse_log_level(const std::string& name, LogLevel& out){
    std::string n = utils::to_lower(utils::trim(name));
    if(n=="error") out = LogLevel::Error;
    else if(n=="warn" || n=="warning") out = LogLevel::Warn;
    else if(n=="info") out = LogLevel::Info;
    else if(n=="debug") out = LogLevel::Debug;
    else if(n=="trace") out = LogLevel::Trace;
    else return false;
    return true;
}

}
