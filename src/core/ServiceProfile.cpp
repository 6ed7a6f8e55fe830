#include "ServiceProfile.h"
#include "../probes/OllamaProbe.h"
#include "../probes/LlamaCppProbe.h"

namespace infer_scan {

namespace {

ServiceProfile make_ollama(){
    ServiceProfile p;
    p.id = "ollama";
    p.display_name = "Ollama";
    p.default_port = 11434;
    p.strategy = ProbeStrategy::SingleEndpoint;
    p.output_prefix = "shodan_ollama";
    p.queries = {
        "product:\"Ollama\"",
        "port:11434",
        "ollama",
        "http.title:\"Ollama\"",
        "\"Ollama API\" port:11434",
        "\"Ollama API\"",
        "http.favicon.hash:-1959422854",
        "http.html:\"ollama\"",
        "http.component:\"Ollama\"",
        "\"Content-Type: text/plain\" port:11434",
        "port:11434 \"HTTP/1.1 200 OK\"",
        "http.status:200 port:11434",
        "http.response.headers.content-type:\"text/plain\" port:11434",
    };
    return p;
}

ServiceProfile make_llamacpp(){
    ServiceProfile p;
    p.id = "llamacpp";
    p.display_name = "llama.cpp";
    p.default_port = 8080;
    p.common_ports = {8080, 8000, 3000, 7860, 5000, 8888};
    p.strategy = ProbeStrategy::MultiEndpoint;
    p.output_prefix = "shodan_llama_cpp_servers";
    p.queries = {
        "title:\"llama.cpp\"",
        "title:\"llama.cpp - chat\"",
        "server:\"llama.cpp\"",
        "http.html:\"llama.cpp\"",
        "http.html:\"llama-cpp-python\"",
        "product:\"llama.cpp\"",
    };
    for(int port : p.common_ports) p.queries.push_back("port:" + std::to_string(port) + " title:\"llama.cpp\"");
    return p;
}

}

const std::vector<ServiceProfile>& service_profiles(){
    static const std::vector<ServiceProfile> profiles = { make_ollama(), make_llamacpp() };
    return profiles;
}

const ServiceProfile* find_service_profile(const std::string& id){
    for(const auto& p : service_profiles()) if(p.id == id) return &p;
    return nullptr;
}

ProbeEnginePtr make_probe_engine(const ServiceProfile& profile, HttpClient& http){
    switch(profile.strategy){
        case ProbeStrategy::SingleEndpoint: return std::make_unique<OllamaProbe>(http);
        case ProbeStrategy::MultiEndpoint: return std::make_unique<LlamaCppProbe>(http);
    }
    return nullptr;
}

}
