#include "ProbeScheduler.h"
#include "../core/Logging.h"
#include <algorithm>

namespace infer_scan {

WorkerPool::WorkerPool(size_t threads){
    size_t n = std::max<size_t>(1, threads);
    workers_.reserve(n);
    for(size_t i = 0; i < n; ++i) workers_.emplace_back([this]{ worker_loop(); });
}

WorkerPool::~WorkerPool(){ wait(); }

void WorkerPool::submit(std::function<void()> task){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(closed_) return;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::wait(){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    for(auto& t : workers_) if(t.joinable()) t.join();
}

void WorkerPool::worker_loop(){
    for(;;){
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&]{ return closed_ || !queue_.empty(); });
            if(queue_.empty()) return; // closed and drained
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

ProbeScheduler::ProbeScheduler(size_t concurrency, std::chrono::milliseconds timeout)
    : concurrency_(std::max<size_t>(1, concurrency)), timeout_(timeout) {}

ProbeResults ProbeScheduler::run(const std::vector<Candidate>& candidates, ProbeEngine& engine){
    ProbeResults results;
    std::mutex results_mutex;
    Logger::instance().debug("Probing " + std::to_string(candidates.size()) + " candidates with " + std::to_string(concurrency_) + " workers (" + engine.name() + ")");
    {
        WorkerPool pool(std::min(concurrency_, std::max<size_t>(1, candidates.size())));
        for(const auto& c : candidates){
            pool.submit([&, c]{
                ProbeOutcome outcome;
                try {
                    outcome = engine.probe(c, timeout_);
                } catch(const std::exception& ex){
                    Logger::instance().warn("Error testing server " + c.to_string() + ": " + ex.what());
                    outcome = ProbeOutcome::unreachable(ex.what());
                }
                if(on_result_){
                    try {
                        on_result_(c, outcome);
                    } catch(const std::exception& ex){
                        Logger::instance().warn("Result callback failed for " + c.to_string() + ": " + ex.what());
                    }
                }
                std::lock_guard<std::mutex> lock(results_mutex);
                results.emplace(c, std::move(outcome));
            });
        }
        pool.wait();
    }
    return results;
}

}
