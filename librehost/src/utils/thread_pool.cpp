#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <string>

ThreadPool::ThreadPool(unsigned threads) {
    threads = std::max(threads, 1u);
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token st) { worker_loop(st); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mtx_);
        accepting_ = false;
    }
    work_cv_.notify_all();
}

void ThreadPool::worker_loop(const std::stop_token st) {
    Job job;
    while (next_job(st, job)) {
        // packaged_task keeps the job's own exceptions for its future
        try {
            job(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Worker job failed outside its task: ") + e.what(),
                        "thread_pool");
        }
        job = nullptr;
        finish_job();
    }
}

bool ThreadPool::next_job(const std::stop_token& st, Job& job) {
    std::unique_lock lock(mtx_);
    work_cv_.wait(lock, st, [this] { return !jobs_.empty() || !accepting_; });
    if (st.stop_requested() || jobs_.empty()) {
        return false;
    }
    job = std::move(jobs_.front());
    jobs_.pop_front();
    return true;
}

void ThreadPool::finish_job() {
    std::lock_guard lock(mtx_);
    if (in_flight_ > 0 && --in_flight_ == 0) {
        idle_cv_.notify_all();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mtx_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(mtx_);
        accepting_ = false;
        in_flight_ -= std::min(in_flight_, jobs_.size());
        jobs_.clear();
        if (in_flight_ == 0) {
            idle_cv_.notify_all();
        }
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}
