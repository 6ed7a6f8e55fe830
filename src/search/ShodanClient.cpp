#include "ShodanClient.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace infer_scan {

namespace {

// Shodan serves fixed-size result pages.
constexpr int kShodanPageSize = 100;

std::string upstream_error(const HttpResponse& resp){
    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if(!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_string())
        return j["error"].get<std::string>();
    if(resp.status == 401 || resp.status == 403) return "Invalid API key";
    return "HTTP " + std::to_string(resp.status);
}

std::string string_or_unknown(const nlohmann::json& j, const char* key){
    if(j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "Unknown";
}

}

ShodanClient::ShodanClient(std::string api_key, HttpClient& http, std::string base_url, std::chrono::milliseconds timeout)
    : api_key_(std::move(api_key)), http_(http), base_url_(std::move(base_url)), timeout_(timeout) {
    if(api_key_.empty()) throw std::invalid_argument("Shodan API key is empty");
    while(!base_url_.empty() && base_url_.back()=='/') base_url_.pop_back();
}

std::optional<HttpResponse> ShodanClient::fetch(const std::string& url, std::string& error){
    HttpRequest req;
    req.url = url;
    req.headers = {"Accept: application/json"};
    req.timeout = timeout_;
    auto resp = http_.get(req, error);
    if(!resp) return std::nullopt;
    if(!resp->ok()){ error = upstream_error(*resp); return std::nullopt; }
    return resp;
}

bool ShodanClient::search(const std::string& query, int page, int limit, SearchPage& out, std::string& error){
    if(limit != kShodanPageSize)
        Logger::instance().debug("shodan: page size is fixed at " + std::to_string(kShodanPageSize) + ", requested " + std::to_string(limit));
    std::string url = base_url_ + "/shodan/host/search?key=" + utils::url_encode(api_key_)
        + "&query=" + utils::url_encode(query) + "&page=" + std::to_string(page) + "&minify=true";
    auto resp = fetch(url, error);
    if(!resp) return false;
    return parse_search_body(resp->body, out, error);
}

bool ShodanClient::host(const std::string& address, HostMetadata& out, std::string& error){
    std::string url = base_url_ + "/shodan/host/" + utils::url_encode(address)
        + "?key=" + utils::url_encode(api_key_) + "&minify=true";
    auto resp = fetch(url, error);
    if(!resp) return false;
    return parse_host_body(resp->body, out, error);
}

bool ShodanClient::parse_search_body(const std::string& body, SearchPage& out, std::string& error){
    auto j = nlohmann::json::parse(body, nullptr, false);
    if(j.is_discarded() || !j.is_object()){ error = "malformed search response"; return false; }
    if(j.contains("error") && j["error"].is_string()){ error = j["error"].get<std::string>(); return false; }
    if(!j.contains("matches") || !j["matches"].is_array()){ error = "search response has no matches array"; return false; }
    out = SearchPage{};
    if(j.contains("total") && j["total"].is_number_integer()) out.total = j["total"].get<long>();
    for(const auto& m : j["matches"]){
        if(!m.is_object() || !m.contains("ip_str") || !m["ip_str"].is_string()){
            Logger::instance().debug("shodan: skipping match without ip_str");
            continue;
        }
        SearchMatch sm;
        sm.ip_str = m["ip_str"].get<std::string>();
        if(m.contains("port") && m["port"].is_number_integer()) sm.port = m["port"].get<int>();
        out.matches.push_back(std::move(sm));
    }
    return true;
}

bool ShodanClient::parse_host_body(const std::string& body, HostMetadata& out, std::string& error){
    auto j = nlohmann::json::parse(body, nullptr, false);
    if(j.is_discarded() || !j.is_object()){ error = "malformed host response"; return false; }
    if(j.contains("error") && j["error"].is_string()){ error = j["error"].get<std::string>(); return false; }
    out = HostMetadata{};
    out.country_name = string_or_unknown(j, "country_name");
    out.city_name = string_or_unknown(j, "city_name");
    if(out.city_name == "Unknown") out.city_name = string_or_unknown(j, "city");
    out.org = string_or_unknown(j, "org");
    if(j.contains("hostnames") && j["hostnames"].is_array()){
        for(const auto& h : j["hostnames"]) if(h.is_string()) out.hostnames.push_back(h.get<std::string>());
    }
    return true;
}

}
