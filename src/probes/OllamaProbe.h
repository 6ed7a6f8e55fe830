#pragma once
#include "Probe.h"
#include "../core/HttpClient.h"

namespace infer_scan {

// Single-endpoint strategy with a strict schema: GET /api/tags must return an
// object with a "models" (current API) or "tags" (legacy API) list.
class OllamaProbe : public ProbeEngine {
public:
    explicit OllamaProbe(HttpClient& http, std::string path = "/api/tags");

    std::string name() const override { return "ollama"; }
    ProbeOutcome probe(const Candidate& candidate, std::chrono::milliseconds timeout) override;

    // Classifies a 2xx body; exposed for tests and fuzzing.
    ProbeOutcome classify(const std::string& body) const;

private:
    HttpClient& http_;
    std::string path_;
};

}
