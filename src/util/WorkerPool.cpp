#include "util/WorkerPool.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace reprise::util {

WorkerPool::WorkerPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
    if (num_threads == 0) num_threads = 1;

    Logger::info("WorkerPool(" + name_ + "): Initializing with " + std::to_string(num_threads) + " worker threads");

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() {
            worker_thread();
        });
    }
}

WorkerPool::~WorkerPool() {
    Logger::debug("WorkerPool(" + name_ + "): Shutting down");

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Logger::debug("WorkerPool(" + name_ + "): Shutdown complete");
}

bool WorkerPool::submit_job(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            Logger::warn("WorkerPool(" + name_ + "): Rejecting job after shutdown");
            return false;
        }
        job_queue_.push(std::move(job));
    }

    cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() {
        return job_queue_.empty() && running_ == 0;
    });
}

size_t WorkerPool::get_queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.size();
}

void WorkerPool::worker_thread() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            // Drain what was queued before shutdown, then exit
            if (stop_ && job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
            ++running_;
        }

        // Execute outside the lock
        try {
            job();
        } catch (const std::exception& e) {
            Logger::error("WorkerPool(" + name_ + "): Job failed: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace reprise::util
