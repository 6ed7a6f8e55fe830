#pragma once
#include "Candidate.h"
#include "../probes/Probe.h"
#include "../search/SearchIndex.h"
#include <mutex>
#include <optional>

namespace infer_scan {

struct EnrichedServer {
    Candidate candidate;
    ProbeOutcome outcome; // always Matched with a payload
    HostMetadata host;
};

struct DebugInfo {
    size_t total_candidates = 0;
    std::vector<std::string> queries;
};

// Outcome of one run: either a list of servers, or an error envelope
// (with diagnostics when nothing matched).
class Report {
public:
    void add_server(EnrichedServer server);
    void set_not_found(const std::string& error, DebugInfo debug);
    void set_error(const std::string& error); // run-level failure

    const std::vector<EnrichedServer>& servers() const { return servers_; }
    bool has_servers() const { return !servers_.empty(); }
    const std::string& error() const { return error_; }
    const std::optional<DebugInfo>& debug_info() const { return debug_; }
    void sort_servers();
private:
    std::vector<EnrichedServer> servers_;
    std::string error_;
    std::optional<DebugInfo> debug_;
    std::mutex mutex_;
};

}
