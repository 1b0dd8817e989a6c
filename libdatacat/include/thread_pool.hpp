//
// Created by Giuseppe Francione on 03/10/26.
//

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to parse candidate files during a sync.
 */

#ifndef DATACAT_THREAD_POOL_HPP
#define DATACAT_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace datacat {

/**
 * @brief A fixed-size thread pool built on std::jthread.
 *
 * @details Parse jobs receive the worker's std::stop_token so a long parse
 * can notice a cancellation request. Results come back through std::future;
 * a job discarded by request_stop() leaves its future with a broken_promise
 * error, which the sync treats as "cancelled".
 */
class ThreadPool {
public:
    /**
     * @param threads Number of worker threads; 0 is bumped to 1.
     */
    explicit ThreadPool(unsigned threads = 1);

    /**
     * @brief Closes the pool and joins the workers; jobs still queued are discarded.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable taking a std::stop_token.
     * @return A future for the callable's result.
     * @throws std::runtime_error if the pool was stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using R = std::invoke_result_t<F, std::stop_token>;
        auto job = std::make_shared<std::packaged_task<R(std::stop_token)>>(std::forward<F>(f));
        auto result = job->get_future();
        {
            std::lock_guard lock(mutex_);
            if (closed_) throw std::runtime_error("enqueue on stopped ThreadPool");
            jobs_.emplace([job](std::stop_token st) { (*job)(st); });
        }
        work_cv_.notify_one();
        return result;
    }

    /**
     * @brief Discards queued jobs and signals running ones through their stop_token.
     */
    void request_stop();

private:
    void work(const std::stop_token& st);

    std::mutex mutex_;                      ///< Protects jobs_ and closed_
    std::condition_variable_any work_cv_;   ///< Wakes workers on a new job or on close
    std::queue<std::function<void(std::stop_token)>> jobs_;
    bool closed_{false};
    std::vector<std::jthread> workers_;
};

} // namespace datacat

#endif // DATACAT_THREAD_POOL_HPP
