#pragma once

#include "audio/MediaEngine.hpp"
#include "backend/MemoryResolver.hpp"
#include "backend/StatePublisher.hpp"
#include "events/PeriodicTask.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>

namespace reprise::collectors {

struct TrackerConfig {
    std::chrono::milliseconds tick_interval{300};
    int durable_save_every_ticks = 10;
    int64_t audiobook_save_interval_ms = 300000;
};

/**
 * PositionTracker: polls the engine while playback runs and persists it.
 *
 * Per tick: read position/duration, publish them, write the fast snapshot.
 * Every Nth tick: durable write through the resolver.
 * Audiobook mode: play time accumulates per tick; crossing the interval
 * resets the accumulator, forces a durable write and announces one
 * auto-save event.
 *
 * Ticks are serialized by tick_mutex_, and a tick that sees its stop token
 * triggered writes nothing.
 */
class PositionTracker {
public:
    PositionTracker(audio::MediaEngine& engine,
                    std::shared_ptr<backend::StatePublisher> publisher,
                    backend::MemoryResolver& resolver,
                    TrackerConfig config = {});
    ~PositionTracker();

    PositionTracker(const PositionTracker&) = delete;
    PositionTracker& operator=(const PositionTracker&) = delete;

    // Cancels a running loop before starting the new one
    void start();
    void stop();
    [[nodiscard]] bool is_running() const;

    // One polling step. Called by the loop; public so it can be driven directly.
    void tick(std::stop_token stop_token);

    void reset_audiobook_accumulator();
    [[nodiscard]] int64_t audiobook_accumulator_ms() const;

private:
    audio::MediaEngine& engine_;
    std::shared_ptr<backend::StatePublisher> publisher_;
    backend::MemoryResolver& resolver_;
    TrackerConfig config_;

    std::unique_ptr<events::PeriodicTask> task_;

    mutable std::mutex tick_mutex_;
    int ticks_since_durable_ = 0;
    int64_t audiobook_accumulator_ms_ = 0;
};

}  // namespace reprise::collectors
