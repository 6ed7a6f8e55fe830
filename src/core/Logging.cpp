#include "Logging.h"
#include <iostream>

namespace infer_scan {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
}

const char* Logger::prefix(LogLevel lvl){
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
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << prefix(lvl) << msg << '\n';
}

}
