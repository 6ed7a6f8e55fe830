#include "JSONWriter.h"
#include <nlohmann/json.hpp>

namespace infer_scan {

namespace {

using ojson = nlohmann::ordered_json;

ojson server_info(const ProbeOutcome& o){
    ojson j;
    j["endpoint"] = o.endpoint;
    if(o.api_type == "openai_compatible"){
        j["api_type"] = o.api_type;
        j["models"] = o.models;
        j["raw_data"] = o.data;
    } else if(o.api_type == "server_header"){
        j["server"] = o.server;
    } else if(o.api_type == "json"){
        j["api_type"] = o.api_type;
        j["data"] = o.data;
    } else if(o.api_type == "web_interface"){
        j["type"] = o.api_type;
        j["title"] = o.title;
    }
    return j;
}

ojson server_json(const EnrichedServer& s){
    ojson j;
    j["ip_str"] = s.candidate.address;
    j["port"] = s.candidate.port;
    if(s.outcome.api_type == "ollama"){
        j["api_version"] = s.outcome.api_version;
        j["models"] = s.outcome.models;
        ojson detail = ojson::array();
        for(const auto& e : s.outcome.entries){
            ojson m;
            m["name"] = e.name;
            m["size"] = e.size;
            m["digest"] = e.digest;
            detail.push_back(std::move(m));
        }
        j["models_detail"] = std::move(detail);
    } else {
        j["server_info"] = server_info(s.outcome);
    }
    j["location"] = { {"country_name", s.host.country_name}, {"city_name", s.host.city_name} };
    j["org"] = s.host.org;
    j["hostnames"] = s.host.hostnames;
    return j;
}

}

std::string JSONWriter::write(const Report& report, const Config& cfg) const {
    ojson root;
    if(report.has_servers()){
        root = ojson::array();
        for(const auto& s : report.servers()) root.push_back(server_json(s));
    } else {
        root["error"] = report.error();
        if(const auto& dbg = report.debug_info()){
            root["debug_info"] = { {"total_unique_ips", dbg->total_candidates}, {"queries", dbg->queries} };
        }
    }
    // replace invalid UTF-8 from remote payloads instead of throwing
    return root.dump(cfg.compact ? -1 : 4, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
