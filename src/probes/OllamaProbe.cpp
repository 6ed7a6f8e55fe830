#include "OllamaProbe.h"
#include "../core/Utils.h"
#include "../core/Logging.h"

namespace infer_scan {

OllamaProbe::OllamaProbe(HttpClient& http, std::string path) : http_(http), path_(std::move(path)) {}

ProbeOutcome OllamaProbe::probe(const Candidate& candidate, std::chrono::milliseconds timeout){
    HttpRequest req;
    req.url = utils::make_http_url(candidate.address, candidate.port, path_);
    req.timeout = timeout;
    std::string err;
    auto resp = http_.get(req, err);
    if(!resp) return ProbeOutcome::unreachable("Request failed: " + err);
    if(!resp->ok()) return ProbeOutcome::not_matched("Request failed: HTTP " + std::to_string(resp->status));
    auto outcome = classify(resp->body);
    if(!outcome.matched()) Logger::instance().debug(candidate.to_string() + ": " + outcome.detail);
    return outcome;
}

ProbeOutcome OllamaProbe::classify(const std::string& body) const {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if(j.is_discarded()) return ProbeOutcome::not_matched("JSON parsing failed");
    if(!j.is_object()){
        auto o = ProbeOutcome::not_matched("Unknown API response format");
        o.data = std::move(j);
        return o;
    }

    const char* key = nullptr;
    std::string version;
    if(j.contains("models")){ key = "models"; version = "new"; }
    else if(j.contains("tags")){ key = "tags"; version = "old"; }
    if(!key || !j[key].is_array()){
        auto o = ProbeOutcome::not_matched("Unknown API response format");
        o.data = std::move(j);
        return o;
    }

    ProbeOutcome out;
    out.status = ProbeStatus::Matched;
    out.endpoint = path_;
    out.api_type = "ollama";
    out.api_version = version;
    for(const auto& item : j[key]){
        if(!item.is_object() || !item.contains("name") || !item["name"].is_string())
            return ProbeOutcome::not_matched(std::string("entry in '") + key + "' has no name");
        ModelEntry e;
        e.name = item["name"].get<std::string>();
        if(item.contains("size")) e.size = item["size"];
        if(item.contains("digest")) e.digest = item["digest"];
        e.details = item;
        out.models.push_back(e.name);
        out.entries.push_back(std::move(e));
    }
    return out;
}

}
