#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <string>

namespace reprise::util {

// Fixed pool of worker threads for blocking work (store writes, metadata
// extraction, lookups) that must stay off the session's event context.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t num_threads = 2, std::string name = "io");
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Destructor finishes queued jobs before joining
    ~WorkerPool();

    // Non-blocking; returns false once shutdown has begun
    [[nodiscard]] bool submit_job(Job job);

    // Blocks until the queue is empty and no job is running
    void wait_idle();

    [[nodiscard]] size_t get_queue_size() const;

private:
    void worker_thread();

    std::string name_;
    std::vector<std::thread> workers_;

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    size_t running_ = 0;

    std::atomic<bool> stop_{false};
};

} // namespace reprise::util
