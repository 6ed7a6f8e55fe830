#include "Utils.h"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace infer_scan {
namespace utils {

std::vector<std::string> read_lines(const std::string& path){
    std::vector<std::string> out;
    std::ifstream f(path);
    if(!f.is_open()) return out;
    std::string line;
    while(std::getline(f, line)){
        if(!line.empty() && line.back()=='\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

std::string trim(const std::string& s){
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_icase(const std::string& haystack, const std::string& needle){
    if(needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c : s){
        if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

std::string url_encode(const std::string& s){
    static const char* hx = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for(unsigned char c : s){
        if(std::isalnum(c) || c=='-' || c=='_' || c=='.' || c=='~'){
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hx[c >> 4]);
            out.push_back(hx[c & 0xF]);
        }
    }
    return out;
}

std::string make_http_url(const std::string& address, int port, const std::string& path){
    std::string host = address;
    if(host.find(':') != std::string::npos && host.front() != '[') host = "[" + host + "]";
    std::string p = path.empty() ? "/" : path;
    if(p.front() != '/') p.insert(p.begin(), '/');
    return "http://" + host + ":" + std::to_string(port) + p;
}

std::string redact_query_param(const std::string& url, const std::string& name){
    auto query = url.find('?');
    if(query == std::string::npos || name.empty()) return url;
    std::string out = url.substr(0, query + 1);
    size_t pos = query + 1;
    while(pos <= url.size()){
        size_t end = url.find_first_of("&#", pos);
        if(end == std::string::npos) end = url.size();
        std::string param = url.substr(pos, end - pos);
        if(param.rfind(name + "=", 0) == 0) param = name + "=REDACTED";
        out += param;
        if(end == url.size()) break;
        out += url[end];
        if(url[end] == '#'){ out += url.substr(end + 1); break; }
        pos = end + 1;
    }
    return out;
}

std::string timestamp_suffix(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    if(std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm) == 0) return "";
    return buf;
}

}
}
