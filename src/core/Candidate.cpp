#include "Candidate.h"

namespace infer_scan {

std::string Candidate::to_string() const {
    if(address.find(':') != std::string::npos) return "[" + address + "]:" + std::to_string(port);
    return address + ":" + std::to_string(port);
}

bool CandidateSet::add(Candidate candidate){
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.insert(std::move(candidate)).second;
}

bool CandidateSet::contains(const Candidate& candidate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.count(candidate) != 0;
}

std::vector<Candidate> CandidateSet::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Candidate>(items_.begin(), items_.end());
}

size_t CandidateSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

}
