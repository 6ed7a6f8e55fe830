#pragma once
#include <string>
#include <vector>
#include <optional>

namespace infer_scan {

struct SearchMatch {
    std::string ip_str;
    std::optional<int> port; // absent when the index did not report one
};

struct SearchPage {
    long total = 0;
    std::vector<SearchMatch> matches;
};

// Enrichment fields; each degrades to "Unknown" when not reported.
struct HostMetadata {
    std::string country_name = "Unknown";
    std::string city_name = "Unknown";
    std::string org = "Unknown";
    std::vector<std::string> hostnames;
};

// Internet-wide search index. Failures are reported through the return value and
// `error`; implementations do not throw for upstream or network errors.
class SearchIndex {
public:
    virtual ~SearchIndex() = default;
    virtual bool search(const std::string& query, int page, int limit, SearchPage& out, std::string& error) = 0;
    virtual bool host(const std::string& address, HostMetadata& out, std::string& error) = 0;
};

}
