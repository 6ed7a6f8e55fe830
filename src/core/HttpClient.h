#pragma once
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <memory>

namespace infer_scan {

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    std::chrono::milliseconds timeout{5000};
    size_t max_body_bytes = 1024 * 1024; // larger bodies fail the request
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers; // names lower-cased

    bool ok() const { return status >= 200 && status < 300; }
    std::string header(const std::string& name) const; // empty if absent
};

// Blocking HTTP GET transport. A std::nullopt return means a transport-level failure
// (DNS, connect, timeout); any HTTP status, including errors, is a response.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual std::optional<HttpResponse> get(const HttpRequest& request, std::string& error) = 0;
};

using HttpClientPtr = std::unique_ptr<HttpClient>;

}
