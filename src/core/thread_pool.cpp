#include <sqlgate/core/thread_pool.hpp>
#include <sqlgate/core/logger.hpp>

#include <exception>

namespace sqlgate {

ThreadPool::ThreadPool(size_t num_threads, size_t max_pending)
    : max_pending_(max_pending)
    , stopping_(false)
{
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.push_back(std::thread(&ThreadPool::worker_loop, this));
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (max_pending_ > 0) {
            space_cv_.wait(lock, [this] { return stopping_ || tasks_.size() < max_pending_; });
        }
        if (stopping_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    space_cv_.notify_all();

    for (size_t i = 0; i < workers_.size(); ++i) {
        if (workers_[i].joinable()) {
            workers_[i].join();
        }
    }
    workers_.clear();
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        space_cv_.notify_one();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[ThreadPool] Task threw: %s", e.what());
        }
    }
}

} // namespace sqlgate
