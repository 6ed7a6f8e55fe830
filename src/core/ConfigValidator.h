#pragma once
#include "Config.h"
#include <map>
#include <string>

namespace infer_scan {

class ConfigValidator {
public:
    // Range and consistency checks; prints the reason to stderr on failure.
    bool validate(const Config& cfg) const;

    // Fills cfg.api_key: --api-key, then SHODAN_API_KEY, then the dotenv file.
    void resolve_credentials(Config& cfg) const;

    // Appends queries from cfg.queries_file. False if the file cannot be opened.
    bool load_queries_file(Config& cfg) const;

    // KEY=VALUE parsing with comments, `export` prefixes and quoted values.
    static std::map<std::string, std::string> parse_env_file(const std::string& path);

    static constexpr const char* kApiKeyVar = "SHODAN_API_KEY";
    static constexpr int kMaxConcurrency = 256;
};

}
