#pragma once
#include "SearchIndex.h"
#include "../core/Candidate.h"
#include <chrono>
#include <functional>

namespace infer_scan {

struct SearchPolicy {
    int page_limit = 10;
    int page_size = 100; // a shorter page ends the query
    std::chrono::milliseconds page_delay{1000};
    int default_port = 11434; // used when a match has no port and fallback_ports is empty
    std::vector<int> fallback_ports; // one candidate per port when a match has no port
};

struct DiscoveryStats {
    size_t queries_run = 0;
    size_t pages_fetched = 0;
    size_t page_errors = 0;
    size_t matches_seen = 0;
};

// Runs every query sequentially, paging each one in order, and feeds the
// discovered (address, port) pairs into a CandidateSet.
class SearchOrchestrator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    SearchOrchestrator(SearchIndex& index, SearchPolicy policy);

    DiscoveryStats discover(const std::vector<std::string>& queries, CandidateSet& out);

    // Replaces the inter-page wait (tests record delays instead of sleeping).
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    // Expands one index match into candidates according to the policy.
    std::vector<Candidate> candidates_for(const SearchMatch& match) const;

private:
    void run_query(const std::string& query, CandidateSet& out, DiscoveryStats& stats);

    SearchIndex& index_;
    SearchPolicy policy_;
    Sleeper sleeper_;
};

}
