#include "ModelListing.h"
#include <sstream>

namespace infer_scan {

namespace {

std::string scalar_text(const nlohmann::json& v){
    if(v.is_string()) return v.get<std::string>();
    return v.dump();
}

}

std::string format_model_listing(const ProbeOutcome& outcome){
    std::ostringstream os;
    const std::string rule(50, '-');
    if(!outcome.matched()){
        os << "\nError: " << (outcome.detail.empty() ? std::string(probe_status_name(outcome.status)) : outcome.detail) << "\n";
        return os.str();
    }
    if(outcome.api_type == "ollama"){
        os << "\nFound " << outcome.entries.size() << " models:\n" << rule << "\n";
        for(const auto& e : outcome.entries){
            os << "Model Name: " << e.name << "\n";
            os << "Model Size: " << scalar_text(e.size) << "\n";
            os << "Model Digest: " << scalar_text(e.digest) << "\n";
            os << rule << "\n";
        }
        return os.str();
    }
    os << "\nMatched " << outcome.api_type << " at " << outcome.endpoint << "\n";
    if(!outcome.models.empty()){
        os << "Found " << outcome.models.size() << " models:\n" << rule << "\n";
        for(const auto& m : outcome.models) os << "Model Name: " << m << "\n";
        os << rule << "\n";
    }
    if(!outcome.server.empty()) os << "Server: " << outcome.server << "\n";
    if(!outcome.title.empty()) os << "Title: " << outcome.title << "\n";
    return os.str();
}

}
