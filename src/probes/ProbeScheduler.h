#pragma once
#include "Probe.h"
#include <map>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace infer_scan {

using ProbeResults = std::map<Candidate, ProbeOutcome>;

// Fixed-size pool of threads draining a FIFO task queue.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);
    // Closes the queue and blocks until every submitted task has run.
    void wait();
    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool closed_ = false;
    std::vector<std::thread> workers_;
};

class ProbeScheduler {
public:
    using ResultCallback = std::function<void(const Candidate&, const ProbeOutcome&)>;

    explicit ProbeScheduler(size_t concurrency = 10, std::chrono::milliseconds timeout = std::chrono::seconds(5));

    // Probes every candidate exactly once. A probe that throws is recorded as
    // Unreachable for that candidate only.
    ProbeResults run(const std::vector<Candidate>& candidates, ProbeEngine& engine);

    // Invoked from worker threads as each probe completes.
    void on_result(ResultCallback cb) { on_result_ = std::move(cb); }

    size_t concurrency() const { return concurrency_; }

private:
    size_t concurrency_;
    std::chrono::milliseconds timeout_;
    ResultCallback on_result_;
};

}
