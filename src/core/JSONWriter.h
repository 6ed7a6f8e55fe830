#pragma once
#include "Report.h"
#include "Config.h"
#include <string>

namespace infer_scan {

class JSONWriter {
public:
    // Array of servers, or the error envelope. Indented by 4 unless cfg.compact.
    std::string write(const Report& report, const Config& cfg) const;
    std::string write(const Report& report) const { return write(report, Config{}); }
};

}
