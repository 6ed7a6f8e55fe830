#include "LlamaCppProbe.h"
#include "../core/Utils.h"
#include "../core/Logging.h"

namespace infer_scan {

LlamaCppProbe::LlamaCppProbe(HttpClient& http, LlamaCppProbeOptions opts) : http_(http), opts_(std::move(opts)) {}

ProbeOutcome LlamaCppProbe::probe(const Candidate& candidate, std::chrono::milliseconds timeout){
    size_t unreachable = 0;
    for(const auto& ep : opts_.endpoints){
        HttpRequest req;
        req.url = utils::make_http_url(candidate.address, candidate.port, ep);
        req.headers = opts_.headers;
        req.timeout = timeout;
        std::string err;
        auto resp = http_.get(req, err);
        if(!resp){
            ++unreachable;
            Logger::instance().trace(candidate.to_string() + ep + ": " + err);
            continue;
        }
        auto outcome = classify(ep, *resp);
        if(outcome.matched()) return outcome;
    }
    if(unreachable == opts_.endpoints.size()) return ProbeOutcome::not_matched("all endpoints unreachable");
    return ProbeOutcome::not_matched("no endpoint matched");
}

bool LlamaCppProbe::extract_model_ids(const nlohmann::json& j, std::vector<std::string>& ids) const {
    if(!j.is_object() || !j.contains("data") || !j["data"].is_array()) return false;
    for(const auto& m : j["data"]){
        if(!m.is_object() || !m.contains("id") || !m["id"].is_string()) return false;
        ids.push_back(m["id"].get<std::string>());
    }
    return true;
}

ProbeOutcome LlamaCppProbe::classify(const std::string& endpoint, const HttpResponse& resp) const {
    if(resp.status != 200) return ProbeOutcome::not_matched("HTTP " + std::to_string(resp.status));
    std::string server = utils::to_lower(resp.header("server"));
    std::string content_type = utils::to_lower(resp.header("content-type"));
    bool is_json = content_type.find("json") != std::string::npos;

    nlohmann::json body;
    if(is_json) body = nlohmann::json::parse(resp.body, nullptr, false);
    bool body_ok = is_json && !body.is_discarded();

    ProbeOutcome out;
    out.status = ProbeStatus::Matched;
    out.endpoint = endpoint;

    if(endpoint == opts_.model_list_endpoint && body_ok){
        std::vector<std::string> ids;
        if(extract_model_ids(body, ids)){
            out.api_type = "openai_compatible";
            out.models = std::move(ids);
            out.data = body;
            return out;
        }
    }
    if(server.find(utils::to_lower(opts_.signature)) != std::string::npos){
        out.api_type = "server_header";
        out.server = server;
        return out;
    }
    if(body_ok && body.is_object()){
        out.api_type = "json";
        out.data = std::move(body);
        return out;
    }
    if(content_type.find("text/html") != std::string::npos && utils::contains_icase(resp.body, opts_.signature)){
        out.api_type = "web_interface";
        out.title = opts_.signature;
        return out;
    }
    return ProbeOutcome::not_matched("no signal at " + endpoint);
}

}
