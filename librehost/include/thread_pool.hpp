/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to rehost the images of a document in parallel.
 */

#ifndef REHOST_THREAD_POOL_HPP
#define REHOST_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

/**
 * @brief Fixed-size pool of std::jthread workers fed from one FIFO queue.
 *
 * @details Jobs receive the worker's std::stop_token and should poll it
 * during long operations (network reads). Destroying the pool stops the
 * workers once their current job returns; jobs still queued are dropped and
 * their futures report std::future_errc::broken_promise.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue @p f, a callable taking a `std::stop_token`.
     * @return Future of the result; an exception thrown by @p f is rethrown
     * by future::get().
     * @throws std::runtime_error once request_stop() has been called.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using Result = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<Result(std::stop_token)>>(std::forward<F>(f));
        auto future = task->get_future();
        {
            std::lock_guard lock(mtx_);
            if (!accepting_) {
                throw std::runtime_error("ThreadPool is stopping, job rejected");
            }
            ++in_flight_;
            jobs_.emplace_back([task](const std::stop_token st) { (*task)(st); });
        }
        work_cv_.notify_one();
        return future;
    }

    /**
     * @brief Block until the queue is empty and no job is running.
     */
    void wait_idle();

    /**
     * @brief Reject new jobs, drop queued ones and signal running ones
     * through their stop_token.
     */
    void request_stop();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    using Job = std::function<void(std::stop_token)>;

    void worker_loop(std::stop_token st);
    bool next_job(const std::stop_token& st, Job& job);
    void finish_job();

    std::mutex mtx_;                      ///< Guards jobs_, in_flight_, accepting_
    std::condition_variable_any work_cv_; ///< Job queued or pool closing
    std::condition_variable idle_cv_;     ///< in_flight_ reached zero
    std::deque<Job> jobs_;
    std::size_t in_flight_ = 0;           ///< Queued plus running
    bool accepting_ = true;
    std::vector<std::jthread> workers_;   ///< Last member: joined before the rest is destroyed
};

#endif // REHOST_THREAD_POOL_HPP
