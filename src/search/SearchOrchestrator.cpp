#include "SearchOrchestrator.h"
#include "../core/Logging.h"
#include <thread>
#include <stdexcept>

namespace infer_scan {

SearchOrchestrator::SearchOrchestrator(SearchIndex& index, SearchPolicy policy)
    : index_(index), policy_(std::move(policy)),
      sleeper_([](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); }) {}

std::vector<Candidate> SearchOrchestrator::candidates_for(const SearchMatch& match) const {
    std::vector<Candidate> out;
    if(match.port && *match.port > 0 && *match.port <= 65535){
        out.push_back(Candidate{match.ip_str, *match.port});
    } else if(!policy_.fallback_ports.empty()){
        for(int p : policy_.fallback_ports) out.push_back(Candidate{match.ip_str, p});
    } else {
        out.push_back(Candidate{match.ip_str, policy_.default_port});
    }
    return out;
}

DiscoveryStats SearchOrchestrator::discover(const std::vector<std::string>& queries, CandidateSet& out){
    DiscoveryStats stats;
    for(const auto& q : queries){
        Logger::instance().info("Searching: " + q);
        try {
            run_query(q, out, stats);
        } catch(const std::exception& ex){
            Logger::instance().warn("Error searching " + q + ": " + ex.what());
        }
        ++stats.queries_run;
    }
    Logger::instance().info("Total unique IP:port combinations found: " + std::to_string(out.size()));
    return stats;
}

void SearchOrchestrator::run_query(const std::string& query, CandidateSet& out, DiscoveryStats& stats){
    for(int page = 1; page <= policy_.page_limit; ++page){
        SearchPage result;
        std::string err;
        bool ok = false;
        try {
            ok = index_.search(query, page, policy_.page_size, result, err);
        } catch(const std::exception& ex){
            err = ex.what();
        }
        if(!ok){
            ++stats.page_errors;
            Logger::instance().warn("Error getting page " + std::to_string(page) + ": " + err);
            if(page < policy_.page_limit) sleeper_(policy_.page_delay);
            continue;
        }
        ++stats.pages_fetched;
        Logger::instance().info("Page " + std::to_string(page) + " - Found " + std::to_string(result.total) + " potential results");
        for(const auto& m : result.matches){
            ++stats.matches_seen;
            for(auto& c : candidates_for(m)) out.add(std::move(c));
        }
        // a short page is the end of results for this query
        if(static_cast<int>(result.matches.size()) < policy_.page_size) break;
        if(page < policy_.page_limit) sleeper_(policy_.page_delay);
    }
}

}
