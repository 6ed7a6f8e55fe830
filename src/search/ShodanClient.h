#pragma once
#include "SearchIndex.h"
#include "../core/HttpClient.h"
#include <chrono>

namespace infer_scan {

// Shodan REST API client. The API key is handed in explicitly; an empty key
// throws std::invalid_argument.
class ShodanClient : public SearchIndex {
public:
    ShodanClient(std::string api_key, HttpClient& http,
                 std::string base_url = "https://api.shodan.io",
                 std::chrono::milliseconds timeout = std::chrono::seconds(30));

    bool search(const std::string& query, int page, int limit, SearchPage& out, std::string& error) override;
    bool host(const std::string& address, HostMetadata& out, std::string& error) override;

    // Exposed for tests: decode response bodies.
    static bool parse_search_body(const std::string& body, SearchPage& out, std::string& error);
    static bool parse_host_body(const std::string& body, HostMetadata& out, std::string& error);

private:
    std::optional<HttpResponse> fetch(const std::string& url, std::string& error);

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

}
