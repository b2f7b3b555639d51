/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool running the per-file compression step.
 *
 * ProcessorExecutor submits one job per input file; the pool size is the
 * `--processes` value from the command line.
 */

#ifndef MEDIAPRESS_THREAD_POOL_HPP
#define MEDIAPRESS_THREAD_POOL_HPP

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
#include <type_traits>
#include <vector>

namespace mediapress {

/**
 * @brief A fixed-size pool of std::jthread workers fed from a FIFO queue.
 *
 * @details Every job is handed the pool's std::stop_token. request_stop()
 * flips it once for all workers, so a job that is waiting on a child
 * process can terminate it and return early.
 */
class ThreadPool {
public:
    /**
     * @param workers Number of worker threads; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned workers = std::thread::hardware_concurrency());

    /// Runs the jobs still queued, then joins the workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queues @p job for execution.
     *
     * @tparam F Callable taking a `std::stop_token`.
     * @return Future for the job's result. A job discarded by request_stop()
     * before it started leaves the future with std::future_errc::broken_promise.
     * @throws std::runtime_error once the pool is closed.
     */
    template<class F>
    auto enqueue(F&& job) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using R = std::invoke_result_t<F, std::stop_token>;
        auto packaged = std::make_shared<std::packaged_task<R(std::stop_token)>>(std::forward<F>(job));
        std::future<R> result = packaged->get_future();
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                throw std::runtime_error("ThreadPool no longer accepts jobs");
            }
            queue_.emplace_back([packaged](std::stop_token token) { (*packaged)(std::move(token)); });
        }
        work_available_.notify_one();
        return result;
    }

    /// Blocks until the queue is empty and no worker is busy.
    void wait_idle();

    /// Closes the pool, discards queued jobs and raises the stop token.
    void request_stop();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    using Job = std::function<void(std::stop_token)>;

    void run_worker();

    std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable drained_;
    std::deque<Job> queue_;
    std::size_t busy_ = 0;   ///< Workers currently inside a job
    bool closed_ = false;
    std::stop_source stop_;
    std::vector<std::jthread> workers_;
};

} // namespace mediapress

#endif // MEDIAPRESS_THREAD_POOL_HPP
