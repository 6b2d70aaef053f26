#include "events/PeriodicTask.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace reprise::events {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Task task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    stop();
    util::Logger::debug("PeriodicTask(" + name_ + "): Starting, interval " +
                        std::to_string(interval_.count()) + "ms");
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

void PeriodicTask::stop() {
    if (!thread_.joinable()) {
        return;
    }

    thread_.request_stop();

    if (thread_.get_id() == std::this_thread::get_id()) {
        // Called from the task itself; the loop exits after this run
        return;
    }

    thread_.join();
    util::Logger::debug("PeriodicTask(" + name_ + "): Stopped");
}

bool PeriodicTask::is_running() const {
    return thread_.joinable() && !thread_.get_stop_token().stop_requested();
}

void PeriodicTask::run(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            // Nothing notifies the cv; only the interval or a stop request ends the wait
            wait_cv_.wait_for(lock, stop_token, interval_, [] { return false; });
        }
        if (stop_token.stop_requested()) {
            break;
        }

        try {
            task_(stop_token);
        } catch (const std::exception& e) {
            util::Logger::error("PeriodicTask(" + name_ + "): Run failed: " + std::string(e.what()));
        }
    }
}

}  // namespace reprise::events
