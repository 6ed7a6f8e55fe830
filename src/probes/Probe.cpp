#include "Probe.h"

namespace infer_scan {

const char* probe_status_name(ProbeStatus s){
    switch(s){
        case ProbeStatus::NotMatched: return "not_matched";
        case ProbeStatus::Matched: return "matched";
        case ProbeStatus::Unreachable: return "unreachable";
    }
    return "unknown";
}

bool ProbeOutcome::has_payload() const {
    if(status != ProbeStatus::Matched) return false;
    if(api_type == "ollama" || api_type == "openai_compatible") return !models.empty();
    if(api_type == "server_header") return !server.empty();
    if(api_type == "json") return data.is_object() && !data.empty();
    if(api_type == "web_interface") return !title.empty();
    return false;
}

ProbeOutcome ProbeOutcome::not_matched(std::string reason){
    ProbeOutcome o;
    o.status = ProbeStatus::NotMatched;
    o.detail = std::move(reason);
    return o;
}

ProbeOutcome ProbeOutcome::unreachable(std::string reason){
    ProbeOutcome o;
    o.status = ProbeStatus::Unreachable;
    o.detail = std::move(reason);
    return o;
}

}
