#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace mediapress {

ThreadPool::ThreadPool(const unsigned workers) {
    const unsigned count = workers == 0 ? 1 : workers;
    workers_.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        workers_.emplace_back([this] { run_worker(); });
    }
    Logger::log(LogLevel::Debug, "Started " + std::to_string(count) + " workers", "ThreadPool");
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    work_available_.notify_all();
    // members are destroyed in reverse order: workers_ joins before the queue goes away
}

void ThreadPool::run_worker() {
    std::unique_lock lock(mutex_);
    for (;;) {
        work_available_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return; // closed and drained
        }

        Job job = std::move(queue_.front());
        queue_.pop_front();
        ++busy_;
        lock.unlock();

        try {
            job(stop_.get_token());
        } catch (const std::exception& e) {
            // packaged_task stores job exceptions in the future; this only sees failures of the wrapper
            Logger::log(LogLevel::Error, std::string("Worker job failed: ") + e.what(), "ThreadPool");
        }

        lock.lock();
        --busy_;
        if (busy_ == 0 && queue_.empty()) {
            drained_.notify_all();
        }
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mutex_);
    drained_.wait(lock, [this] { return busy_ == 0 && queue_.empty(); });
}

void ThreadPool::request_stop() {
    std::deque<Job> discarded;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        discarded.swap(queue_);
        if (busy_ == 0) {
            drained_.notify_all();
        }
    }
    stop_.request_stop();
    work_available_.notify_all();
    // destroying the packaged tasks outside the lock breaks their promises
    discarded.clear();
}

} // namespace mediapress
