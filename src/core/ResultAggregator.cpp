#include "ResultAggregator.h"
#include "Logging.h"
#include <map>

namespace infer_scan {

ResultAggregator::ResultAggregator(std::string not_found_error, std::vector<std::string> queries)
    : not_found_error_(std::move(not_found_error)), queries_(std::move(queries)) {}

void ResultAggregator::aggregate(const ProbeResults& outcomes, const HostLookup& lookup, size_t total_candidates, Report& out) const {
    auto& log = Logger::instance();
    std::map<std::string, HostMetadata> host_cache; // one lookup per address
    for(const auto& [candidate, outcome] : outcomes){
        if(!outcome.matched()) continue;
        if(!outcome.has_payload()){
            log.info("Skipping server " + candidate.to_string() + ", no available models");
            continue;
        }
        log.info("Found active server: " + candidate.to_string() + (outcome.models.empty() ? std::string() : " models: " + std::to_string(outcome.models.size())));

        auto it = host_cache.find(candidate.address);
        if(it == host_cache.end()){
            HostMetadata meta;
            std::string err;
            bool ok = false;
            if(lookup){
                try {
                    ok = lookup(candidate.address, meta, err);
                } catch(const std::exception& ex){
                    err = ex.what();
                }
            } else {
                err = "no host lookup configured";
            }
            if(!ok){
                log.warn("Error getting server details for " + candidate.address + ": " + err);
                meta = HostMetadata{};
            }
            it = host_cache.emplace(candidate.address, std::move(meta)).first;
        }
        out.add_server(EnrichedServer{candidate, outcome, it->second});
    }
    if(!out.has_servers()){
        out.set_not_found(not_found_error_, DebugInfo{total_candidates, queries_});
        return;
    }
    out.sort_servers();
}

}
