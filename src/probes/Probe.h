#pragma once
#include "../core/Candidate.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <chrono>

namespace infer_scan {

enum class ProbeStatus { NotMatched, Matched, Unreachable };

const char* probe_status_name(ProbeStatus s);

struct ModelEntry {
    std::string name;
    nlohmann::json size = "Unknown";
    nlohmann::json digest = "Unknown";
    nlohmann::json details; // the entry as served
};

// Result of one full probe of one candidate.
struct ProbeOutcome {
    ProbeStatus status = ProbeStatus::NotMatched;
    std::string endpoint;    // path that produced the match
    std::string api_type;    // ollama | openai_compatible | server_header | json | web_interface
    std::string api_version; // ollama only: "new" (models) or "old" (tags)
    std::vector<std::string> models;
    std::vector<ModelEntry> entries;
    nlohmann::json data;     // raw payload, or the rejected body for diagnostics
    std::string server;      // Server header (server_header)
    std::string title;       // web_interface
    std::string detail;      // reason for NotMatched / Unreachable

    bool matched() const { return status == ProbeStatus::Matched; }
    // Matched hits without anything informative are not reported.
    bool has_payload() const;

    static ProbeOutcome not_matched(std::string reason);
    static ProbeOutcome unreachable(std::string reason);
};

// One fingerprinting strategy. Implementations return every failure as an
// outcome; they do not throw for network or format errors.
class ProbeEngine {
public:
    virtual ~ProbeEngine() = default;
    virtual std::string name() const = 0;
    virtual ProbeOutcome probe(const Candidate& candidate, std::chrono::milliseconds timeout) = 0;
};

using ProbeEnginePtr = std::unique_ptr<ProbeEngine>;

}
