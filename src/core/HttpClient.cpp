#include "HttpClient.h"
#include "Utils.h"

namespace infer_scan {

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(utils::to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

}
