#include "ConfigValidator.h"
#include "ServiceProfile.h"
#include "Utils.h"
#include "Logging.h"
#include <iostream>
#include <fstream>
#include <cstdlib>

namespace infer_scan {

bool ConfigValidator::validate(const Config& cfg) const {
    if(!find_service_profile(cfg.service)){
        std::cerr << "Unknown --service value: " << cfg.service << "\n";
        return false;
    }
    if(cfg.concurrency < 1 || cfg.concurrency > kMaxConcurrency){
        std::cerr << "--concurrency must be between 1 and " << kMaxConcurrency << "\n";
        return false;
    }
    if(cfg.timeout_seconds < 1){ std::cerr << "--timeout must be at least 1 second\n"; return false; }
    if(cfg.page_limit < 1){ std::cerr << "--page-limit must be at least 1\n"; return false; }
    if(cfg.page_size < 1){ std::cerr << "--page-size must be at least 1\n"; return false; }
    if(cfg.page_delay_ms < 0){ std::cerr << "--page-delay-ms cannot be negative\n"; return false; }
    if(cfg.target_port < 0 || cfg.target_port > 65535){ std::cerr << "--port must be between 0 and 65535\n"; return false; }
    if(cfg.target_port != 0 && cfg.target.empty()){ std::cerr << "--port requires --target\n"; return false; }
    if(cfg.target.empty()){
        if(cfg.api_key.empty()){
            std::cerr << "Please set the " << kApiKeyVar << " environment variable first\n";
            return false;
        }
        if(cfg.search_base_url.rfind("http://", 0) != 0 && cfg.search_base_url.rfind("https://", 0) != 0){
            std::cerr << "--search-url must be an http(s) URL\n";
            return false;
        }
    }
    return true;
}

void ConfigValidator::resolve_credentials(Config& cfg) const {
    if(!cfg.api_key.empty()) return;
    if(const char* v = std::getenv(kApiKeyVar); v && *v){
        cfg.api_key = v;
        return;
    }
    if(cfg.env_file.empty()) return;
    auto vars = parse_env_file(cfg.env_file);
    auto it = vars.find(kApiKeyVar);
    if(it != vars.end() && !it->second.empty()){
        Logger::instance().debug(std::string("Using ") + kApiKeyVar + " from " + cfg.env_file);
        cfg.api_key = it->second;
    }
}

bool ConfigValidator::load_queries_file(Config& cfg) const {
    if(cfg.queries_file.empty()) return true;
    std::ifstream probe(cfg.queries_file);
    if(!probe){
        std::cerr << "Failed to open queries file: " << cfg.queries_file << "\n";
        return false;
    }
    for(const auto& raw : utils::read_lines(cfg.queries_file)){
        std::string line = utils::trim(raw);
        if(line.empty() || line[0] == '#') continue;
        cfg.queries.push_back(line);
    }
    return true;
}

std::map<std::string, std::string> ConfigValidator::parse_env_file(const std::string& path){
    std::map<std::string, std::string> out;
    for(const auto& raw : utils::read_lines(path)){
        std::string line = utils::trim(raw);
        if(line.empty() || line[0] == '#') continue;
        if(line.rfind("export ", 0) == 0) line = utils::trim(line.substr(7));
        auto eq = line.find('=');
        if(eq == std::string::npos || eq == 0) continue;
        std::string key = utils::trim(line.substr(0, eq));
        std::string value = utils::trim(line.substr(eq + 1));
        if(value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()){
            value = value.substr(1, value.size() - 2);
        } else {
            // unquoted: strip trailing comment
            auto hash = value.find(" #");
            if(hash != std::string::npos) value = utils::trim(value.substr(0, hash));
        }
        out[key] = value;
    }
    return out;
}

}
