#include "CurlHttpClient.h"
#include "Utils.h"
#include "Logging.h"
#include <curl/curl.h>
#include <mutex>

namespace infer_scan {

namespace detail {

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata){
    auto* sink = reinterpret_cast<BodySink*>(userdata);
    size_t n = size * nmemb;
    if(sink->response->body.size() + n > sink->limit){
        sink->overflow = true;
        return 0;
    }
    sink->response->body.append(ptr, n);
    return n;
}

size_t read_header(char* ptr, size_t size, size_t nmemb, void* userdata){
    auto* resp = reinterpret_cast<HttpResponse*>(userdata);
    std::string line(ptr, size * nmemb);
    // new status line (redirect hop): drop headers of the previous response
    if(line.rfind("HTTP/", 0) == 0){ resp->headers.clear(); return size * nmemb; }
    auto colon = line.find(':');
    if(colon != std::string::npos){
        std::string name = utils::to_lower(utils::trim(line.substr(0, colon)));
        std::string value = utils::trim(line.substr(colon + 1));
        if(!name.empty()) resp->headers[name] = value;
    }
    return size * nmemb;
}

}

namespace {

std::once_flag curl_init_flag;

void restrict_protocols(CURL* curl){
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
#endif
}

}

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    std::call_once(curl_init_flag, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::optional<HttpResponse> CurlHttpClient::get(const HttpRequest& request, std::string& error){
    const std::string logged_url = utils::redact_query_param(request.url, "key");
    CURL* curl = curl_easy_init();
    if(!curl){ error = "curl_easy_init failed"; return std::nullopt; }
    HttpResponse resp;
    detail::BodySink sink{&resp, request.max_body_bytes, false};
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    restrict_protocols(curl);
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(request.max_body_bytes));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, detail::write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, detail::read_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    struct curl_slist* headers = nullptr;
    for(const auto& h : request.headers) headers = curl_slist_append(headers, h.c_str());
    if(headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode rc = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    if(headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if(sink.overflow || rc == CURLE_FILESIZE_EXCEEDED){
        error = "response body exceeds " + std::to_string(request.max_body_bytes) + " bytes";
        Logger::instance().trace("GET " + logged_url + " aborted: " + error);
        return std::nullopt;
    }
    if(rc != CURLE_OK){
        error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
        Logger::instance().trace("GET " + logged_url + " failed: " + error);
        return std::nullopt;
    }
    Logger::instance().trace("GET " + logged_url + " -> " + std::to_string(resp.status));
    return resp;
}

}
