#include "Report.h"
#include <algorithm>

namespace infer_scan {

void Report::add_server(EnrichedServer server){
    std::lock_guard<std::mutex> lock(mutex_);
    servers_.push_back(std::move(server));
}

void Report::set_not_found(const std::string& error, DebugInfo debug){
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
    debug_ = std::move(debug);
}

void Report::set_error(const std::string& error){
    std::lock_guard<std::mutex> lock(mutex_);
    servers_.clear();
    error_ = error;
    debug_.reset();
}

void Report::sort_servers(){
    std::lock_guard<std::mutex> lock(mutex_);
    std::sort(servers_.begin(), servers_.end(), [](const EnrichedServer& a, const EnrichedServer& b){ return a.candidate < b.candidate; });
}

}
