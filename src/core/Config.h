#pragma once
#include <string>
#include <vector>
#include "Logging.h"

namespace infer_scan {

struct Config {
    std::string service = "ollama"; // service profile id
    std::string api_key; // resolved by ConfigValidator (flag > env > env file)
    std::string env_file = ".env";
    std::vector<std::string> queries; // overrides profile queries if non-empty
    std::string queries_file; // newline-delimited queries (comments starting with #)
    std::string target; // single-host lookup mode when set
    int target_port = 0; // 0 = profile default
    std::string output_file; // empty = timestamped default, "-" = stdout
    bool compact = false;
    bool quiet = false;
    bool verbose = false;
    int concurrency = 10;
    int timeout_seconds = 5; // per probe request
    int page_limit = 10;
    int page_size = 100;
    int page_delay_ms = 1000;
    std::string search_base_url = "https://api.shodan.io";
};

// quiet wins over verbose
LogLevel log_level_for(const Config& cfg);

}
