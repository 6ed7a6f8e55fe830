#include "ArgumentParser.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <iostream>
#include <functional>
#include <vector>
#include <string>

namespace infer_scan {

namespace {

enum class ArgKind { None, String, Int, CSV };

struct FlagSpec {
    const char* name;
    ArgKind kind;
    const char* help;
    std::function<void(Config&, const std::string&)> apply;
    int Config::* int_field = nullptr;
};

bool to_int(const std::string& v, int& out){
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if(used != v.size()) return false;
        out = n;
        return true;
    } catch(const std::exception&){
        return false;
    }
}

const std::vector<FlagSpec>& flag_specs(){
    static const std::vector<FlagSpec> specs = {
        {"--service", ArgKind::String, "Service family: ollama (default) or llamacpp", [](Config& c, const std::string& v){ c.service = v; }},
        {"--api-key", ArgKind::String, "Search index API key (else SHODAN_API_KEY)", [](Config& c, const std::string& v){ c.api_key = v; }},
        {"--env-file", ArgKind::String, "Dotenv file to read credentials from (default .env)", [](Config& c, const std::string& v){ c.env_file = v; }},
        {"--query", ArgKind::CSV, "Replace profile queries (repeatable, comma-separated)", [](Config& c, const std::string& v){ for(auto& q : utils::split_csv(v)) c.queries.push_back(q); }},
        {"--queries-file", ArgKind::String, "File with one query per line", [](Config& c, const std::string& v){ c.queries_file = v; }},
        {"--target", ArgKind::String, "Probe a single host and list its models", [](Config& c, const std::string& v){ c.target = v; }},
        {"--port", ArgKind::Int, "Port for --target (default: service port)", nullptr, &Config::target_port},
        {"--output", ArgKind::String, "Write JSON to FILE ('-' for stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--compact", ArgKind::None, "Minified JSON output", [](Config& c, const std::string&){ c.compact = true; }},
        {"--quiet", ArgKind::None, "Only warnings and errors", [](Config& c, const std::string&){ c.quiet = true; }},
        {"--verbose", ArgKind::None, "Debug logging", [](Config& c, const std::string&){ c.verbose = true; }},
        {"--concurrency", ArgKind::Int, "Parallel probe workers (default 10)", nullptr, &Config::concurrency},
        {"--timeout", ArgKind::Int, "Per-request probe timeout in seconds (default 5)", nullptr, &Config::timeout_seconds},
        {"--page-limit", ArgKind::Int, "Max pages per query (default 10)", nullptr, &Config::page_limit},
        {"--page-size", ArgKind::Int, "Matches per full page (default 100)", nullptr, &Config::page_size},
        {"--page-delay-ms", ArgKind::Int, "Delay between result pages (default 1000)", nullptr, &Config::page_delay_ms},
        {"--search-url", ArgKind::String, "Search index base URL", [](Config& c, const std::string& v){ c.search_base_url = v; }},
        {"--version", ArgKind::None, "Print version & exit", nullptr},
        {"--help", ArgKind::None, "Show this help", nullptr},
    };
    return specs;
}

}

void ArgumentParser::print_help(std::ostream& os){
    os << "infer-scan options:\n";
    for(const auto& s : flag_specs()){
        std::string name = s.name;
        if(s.kind == ArgKind::Int) name += " N";
        else if(s.kind == ArgKind::String || s.kind == ArgKind::CSV) name += " VALUE";
        os << "  " << name;
        if(name.size() < 30) os << std::string(30 - name.size(), ' '); else os << ' ';
        os << s.help << "\n";
    }
}

void ArgumentParser::print_version(std::ostream& os){
    os << "infer-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
       << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
       << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--help"){ print_help(std::cout); return false; }
        if(a == "--version"){ print_version(std::cout); return false; }
        const FlagSpec* spec = nullptr;
        for(const auto& s : flag_specs()) if(a == s.name){ spec = &s; break; }
        if(!spec){
            std::cerr << "Unknown arg: " << a << "\n";
            print_help(std::cerr);
            exit_code_ = 2;
            return false;
        }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i + 1 >= argc){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        if(spec->kind == ArgKind::Int){
            int n = 0;
            if(!to_int(val, n)){ std::cerr << "Invalid integer for " << a << "\n"; exit_code_ = 2; return false; }
            cfg.*(spec->int_field) = n;
            continue;
        }
        if(spec->apply) spec->apply(cfg, val);
    }
    return true;
}

}
