#pragma once
#include "Config.h"
#include "Report.h"
#include "ServiceProfile.h"
#include "../search/SearchOrchestrator.h"

namespace infer_scan {

// Two sequential phases: search discovery, then concurrent probing, then aggregation.
class DiscoveryPipeline {
public:
    DiscoveryPipeline(const Config& cfg, const ServiceProfile& profile, SearchIndex& index, ProbeEngine& engine);

    void run(Report& report);

    // Configured queries if any, else the profile's.
    std::vector<std::string> queries() const;
    const DiscoveryStats& stats() const { return stats_; }

    void set_sleeper(SearchOrchestrator::Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    const Config& cfg_;
    const ServiceProfile& profile_;
    SearchIndex& index_;
    ProbeEngine& engine_;
    DiscoveryStats stats_;
    SearchOrchestrator::Sleeper sleeper_;
};

}
