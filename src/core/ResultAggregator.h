#pragma once
#include "Report.h"
#include "../probes/ProbeScheduler.h"
#include <functional>

namespace infer_scan {

// Host enrichment; returns false (with `error`) when the lookup failed.
using HostLookup = std::function<bool(const std::string& address, HostMetadata& out, std::string& error)>;

class ResultAggregator {
public:
    // `not_found_error` is the envelope message used when nothing is reported.
    ResultAggregator(std::string not_found_error, std::vector<std::string> queries);

    void aggregate(const ProbeResults& outcomes, const HostLookup& lookup, size_t total_candidates, Report& out) const;

private:
    std::string not_found_error_;
    std::vector<std::string> queries_;
};

}
