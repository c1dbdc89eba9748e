/*
 * sqlgate - Fixed-size worker pool
 *
 * Tasks run in FIFO order on N worker threads. With a pending cap, enqueue()
 * blocks the producer while the queue is full. shutdown() stops accepting
 * new tasks, drains the queue, and joins the workers.
 */
#ifndef sqlgate_CORE_THREAD_POOL_HPP
#define sqlgate_CORE_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sqlgate {

class ThreadPool {
public:
    // max_pending == 0 leaves the queue unbounded
    explicit ThreadPool(size_t num_threads, size_t max_pending = 0);
    ~ThreadPool();

    // Waits for queue space when capped. Returns false once shutdown()
    // has begun, including while waiting.
    bool enqueue(std::function<void()> task);

    // Tasks queued but not yet picked up by a worker
    size_t pending() const;

    size_t size() const { return workers_.size(); }
    size_t max_pending() const { return max_pending_; }

    void shutdown();

private:
    ThreadPool(const ThreadPool&);
    ThreadPool& operator=(const ThreadPool&);

    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()> > tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable space_cv_;  // signalled when a task leaves the queue
    const size_t max_pending_;
    bool stopping_;
};

} // namespace sqlgate

#endif // sqlgate_CORE_THREAD_POOL_HPP
