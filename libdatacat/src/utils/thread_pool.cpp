//
// Created by Giuseppe Francione on 03/10/26.
//

#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace datacat {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { work(st); });
    }
}

void ThreadPool::work(const std::stop_token& st) {
    for (;;) {
        std::function<void(std::stop_token)> job;
        {
            std::unique_lock lock(mutex_);
            work_cv_.wait(lock, st, [this] { return closed_ || !jobs_.empty(); });
            if (st.stop_requested() || jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        try {
            job(st);
        } catch (const std::exception& e) {
            // packaged_task stores the parser's exceptions; this only sees failures of the wrapper
            Logger::log(LogLevel::Error, std::string("parse job failed: ") + e.what(), "catalog");
        }
    }
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        std::queue<std::function<void(std::stop_token)>>().swap(jobs_);
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    work_cv_.notify_all();
}

} // namespace datacat
