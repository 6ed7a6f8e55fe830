#pragma once
#include <string>
#include <vector>
#include <set>
#include <mutex>
#include <tuple>

namespace infer_scan {

// A discovered (address, port) pair awaiting confirmation.
struct Candidate {
    std::string address;
    int port = 0;

    std::string to_string() const;

    bool operator<(const Candidate& o) const { return std::tie(address, port) < std::tie(o.address, o.port); }
    bool operator==(const Candidate& o) const { return address == o.address && port == o.port; }
    bool operator!=(const Candidate& o) const { return !(*this == o); }
};

// Deduplicated candidate collection keyed on (address, port).
// Insertion is guarded so that concurrent writers cannot corrupt it.
class CandidateSet {
public:
    // Returns true if the pair was not present before.
    bool add(Candidate candidate);
    bool contains(const Candidate& candidate) const;
    std::vector<Candidate> all() const;
    size_t size() const;
    bool empty() const { return size() == 0; }
private:
    mutable std::mutex mutex_;
    std::set<Candidate> items_;
};

}
