#include "DiscoveryPipeline.h"
#include "ResultAggregator.h"
#include "Logging.h"
#include "../probes/ProbeScheduler.h"

namespace infer_scan {

DiscoveryPipeline::DiscoveryPipeline(const Config& cfg, const ServiceProfile& profile, SearchIndex& index, ProbeEngine& engine)
    : cfg_(cfg), profile_(profile), index_(index), engine_(engine) {}

std::vector<std::string> DiscoveryPipeline::queries() const {
    return cfg_.queries.empty() ? profile_.queries : cfg_.queries;
}

void DiscoveryPipeline::run(Report& report){
    auto qs = queries();

    SearchPolicy policy;
    policy.page_limit = cfg_.page_limit;
    policy.page_size = cfg_.page_size;
    policy.page_delay = std::chrono::milliseconds(cfg_.page_delay_ms);
    policy.default_port = profile_.default_port;
    policy.fallback_ports = profile_.common_ports;

    SearchOrchestrator orchestrator(index_, policy);
    if(sleeper_) orchestrator.set_sleeper(sleeper_);
    CandidateSet candidates;
    stats_ = orchestrator.discover(qs, candidates);

    ProbeScheduler scheduler(static_cast<size_t>(cfg_.concurrency), std::chrono::seconds(cfg_.timeout_seconds));
    auto all = candidates.all();
    auto outcomes = scheduler.run(all, engine_);

    ResultAggregator aggregator(profile_.not_found_error(), qs);
    aggregator.aggregate(outcomes,
        [this](const std::string& address, HostMetadata& meta, std::string& err){ return index_.host(address, meta, err); },
        all.size(), report);
    Logger::instance().debug("Run complete: " + std::to_string(report.servers().size()) + " servers reported");
}

}
