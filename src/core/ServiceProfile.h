#pragma once
#include "../probes/Probe.h"
#include "HttpClient.h"
#include <string>
#include <vector>

namespace infer_scan {

enum class ProbeStrategy { SingleEndpoint, MultiEndpoint };

// Per service family discovery policy.
struct ServiceProfile {
    std::string id;
    std::string display_name;
    std::vector<std::string> queries;
    int default_port = 0;
    std::vector<int> common_ports; // fan-out for matches without a port
    ProbeStrategy strategy = ProbeStrategy::SingleEndpoint;
    std::string output_prefix;

    int lookup_port() const { return common_ports.empty() ? default_port : common_ports.front(); }
    std::string not_found_error() const { return "No accessible " + display_name + " servers found"; }
};

const std::vector<ServiceProfile>& service_profiles();
const ServiceProfile* find_service_profile(const std::string& id);

ProbeEnginePtr make_probe_engine(const ServiceProfile& profile, HttpClient& http);

}
