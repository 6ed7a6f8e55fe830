#include "Config.h"

namespace infer_scan {

LogLevel log_level_for(const Config& cfg){
    if(cfg.quiet) return LogLevel::Warn;
    if(cfg.verbose) return LogLevel::Debug;
    return LogLevel::Info;
}

}
