#include "collectors/PositionTracker.hpp"
#include "util/Logger.hpp"

namespace reprise::collectors {

PositionTracker::PositionTracker(audio::MediaEngine& engine,
                                 std::shared_ptr<backend::StatePublisher> publisher,
                                 backend::MemoryResolver& resolver,
                                 TrackerConfig config)
    : engine_(engine),
      publisher_(std::move(publisher)),
      resolver_(resolver),
      config_(config) {
    if (config_.durable_save_every_ticks < 1) config_.durable_save_every_ticks = 1;
    if (config_.tick_interval.count() < 1) config_.tick_interval = std::chrono::milliseconds(1);
}

PositionTracker::~PositionTracker() {
    stop();
}

void PositionTracker::start() {
    stop();
    util::Logger::debug("PositionTracker: Starting");
    task_ = std::make_unique<events::PeriodicTask>(
        "position-tracker", config_.tick_interval,
        [this](std::stop_token st) { tick(st); });
    task_->start();
}

void PositionTracker::stop() {
    if (!task_) return;
    task_->stop();
    task_.reset();
    util::Logger::debug("PositionTracker: Stopped");
}

bool PositionTracker::is_running() const {
    return task_ && task_->is_running();
}

void PositionTracker::tick(std::stop_token stop_token) {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (stop_token.stop_requested()) return;

    // Item first, then the engine: a position is only written under the
    // item the engine is still on
    auto snap = publisher_->get_current();
    int index = engine_.current_index();
    int64_t position = engine_.current_position_ms();
    int64_t duration = engine_.duration_ms();
    if (index != snap->current_index) return;

    publisher_->update([&](model::Snapshot& s) {
        if (s.current_index != index) return;
        s.position_ms = position;
        if (duration > 0) s.duration_ms = duration;
    });

    if (!snap->current_ref) return;
    const auto& ref = *snap->current_ref;
    if (duration <= 0) duration = snap->duration_ms;

    if (stop_token.stop_requested()) return;
    resolver_.save_snapshot(ref, position, duration, snap->folder_identity, snap->display_name);

    if (++ticks_since_durable_ >= config_.durable_save_every_ticks) {
        ticks_since_durable_ = 0;
        if (stop_token.stop_requested()) return;
        resolver_.save_memory(ref, position, duration, snap->folder_identity, snap->display_name);
    }

    if (snap->audiobook_mode && snap->is_playing) {
        audiobook_accumulator_ms_ += config_.tick_interval.count();
        if (audiobook_accumulator_ms_ >= config_.audiobook_save_interval_ms) {
            audiobook_accumulator_ms_ = 0;
            if (stop_token.stop_requested()) return;
            resolver_.save_memory(ref, position, duration, snap->folder_identity, snap->display_name);
            util::Logger::info("PositionTracker: Audiobook auto-save for " + snap->display_name +
                               " at " + std::to_string(position) + "ms");
            resolver_.announce({ref.identity(), position, snap->display_name, true});
        }
    }
}

void PositionTracker::reset_audiobook_accumulator() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    audiobook_accumulator_ms_ = 0;
}

int64_t PositionTracker::audiobook_accumulator_ms() const {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    return audiobook_accumulator_ms_;
}

}  // namespace reprise::collectors
