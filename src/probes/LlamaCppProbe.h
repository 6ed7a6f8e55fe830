#pragma once
#include "Probe.h"
#include "../core/HttpClient.h"

namespace infer_scan {

struct LlamaCppProbeOptions {
    std::string signature = "llama.cpp";
    std::vector<std::string> endpoints = {"/v1/models", "/", "/model", "/v1/completions"};
    std::string model_list_endpoint = "/v1/models";
    std::vector<std::string> headers = {"Accept: application/json", "Content-Type: application/json"};
};

// Multi-endpoint heuristic strategy. Endpoints are tried in order and the first
// positive signal wins, ranked: model list > Server header > JSON object > HTML page.
class LlamaCppProbe : public ProbeEngine {
public:
    explicit LlamaCppProbe(HttpClient& http, LlamaCppProbeOptions opts = {});

    std::string name() const override { return "llamacpp"; }
    ProbeOutcome probe(const Candidate& candidate, std::chrono::milliseconds timeout) override;

    // Classifies one endpoint's response; NotMatched means "try the next endpoint".
    ProbeOutcome classify(const std::string& endpoint, const HttpResponse& resp) const;

private:
    bool extract_model_ids(const nlohmann::json& j, std::vector<std::string>& ids) const;

    HttpClient& http_;
    LlamaCppProbeOptions opts_;
};

}
