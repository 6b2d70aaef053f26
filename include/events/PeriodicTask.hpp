#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace reprise::events {

/**
 * Runs a callback at a fixed interval on its own thread until stopped.
 *
 * The wait between runs is interruptible: stop() wakes the thread at once
 * and joins it. The callback receives the stop token so it can tell a
 * cancelled run from a normal one.
 */
class PeriodicTask {
public:
    using Task = std::function<void(std::stop_token)>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Task task);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();

    // Safe to call repeatedly, and from inside the task (then it only requests stop)
    void stop();

    [[nodiscard]] bool is_running() const;

private:
    void run(std::stop_token stop_token);

    std::string name_;
    std::chrono::milliseconds interval_;
    Task task_;

    std::jthread thread_;
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
};

}  // namespace reprise::events
