#include "core/HttpClient.h"
#include "probes/OllamaProbe.h"
#include "probes/LlamaCppProbe.h"
#include <cstdint>
#include <cstddef>
#include <string>

namespace {

// classify() never touches the transport.
class NullHttpClient : public infer_scan::HttpClient {
public:
    std::optional<infer_scan::HttpResponse> get(const infer_scan::HttpRequest&, std::string& error) override {
        error = "offline";
        return std::nullopt;
    }
};

}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string body(reinterpret_cast<const char*>(data), size);
    NullHttpClient http;

    infer_scan::OllamaProbe ollama(http);
    auto a = ollama.classify(body);
    (void)a.has_payload();

    infer_scan::LlamaCppProbe llama(http);
    infer_scan::HttpResponse resp;
    resp.status = 200;
    resp.body = body;
    resp.headers["content-type"] = "application/json";
    resp.headers["server"] = size > 0 && (data[0] & 1) ? "llama.cpp" : "nginx";
    for (const char* ep : {"/v1/models", "/"}) {
        auto b = llama.classify(ep, resp);
        (void)b.has_payload();
    }
    resp.headers["content-type"] = "text/html";
    (void)llama.classify("/", resp);
    return 0;
}
