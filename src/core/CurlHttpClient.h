#pragma once
#include "HttpClient.h"
#include <cstddef>

namespace infer_scan {

// libcurl-backed client. One easy handle per request, so concurrent get() calls are safe.
// Only http and https are allowed, including on redirects.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent);
    std::optional<HttpResponse> get(const HttpRequest& request, std::string& error) override;
private:
    std::string user_agent_;
};

namespace detail {

// Destination of libcurl's body writes. Writing past `limit` sets `overflow`
// and makes the callback report a short write, which aborts the transfer.
struct BodySink {
    HttpResponse* response = nullptr;
    size_t limit = 0;
    bool overflow = false;
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata);
size_t read_header(char* ptr, size_t size, size_t nmemb, void* userdata);

}

}
