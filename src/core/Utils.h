#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace infer_scan {
namespace utils {

// Reads a text file line by line; missing file yields an empty vector.
std::vector<std::string> read_lines(const std::string& path);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool contains_icase(const std::string& haystack, const std::string& needle);

// Splits on commas, dropping empty pieces.
std::vector<std::string> split_csv(const std::string& s);

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string url_encode(const std::string& s);

// http://host:port/path, bracketing IPv6 literals.
std::string make_http_url(const std::string& address, int port, const std::string& path);

// Replaces the value of every `name=` query parameter with "REDACTED" (for logging URLs).
std::string redact_query_param(const std::string& url, const std::string& name);

// Local time formatted as YYYYmmdd_HHMMSS (used in default output names).
std::string timestamp_suffix(std::chrono::system_clock::time_point tp);

}
}
