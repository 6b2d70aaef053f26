#pragma once

#include "audio/MediaEngine.hpp"
#include "backend/MemoryResolver.hpp"
#include "backend/MemoryStore.hpp"
#include "backend/StatePublisher.hpp"
#include "collectors/PositionTracker.hpp"
#include "events/EventBus.hpp"
#include "model/Snapshot.hpp"
#include "player/BackgroundSession.hpp"
#include "util/Channel.hpp"
#include "util/WorkerPool.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace reprise::player {

using MetadataReader = std::function<model::TrackMetadata(const model::MediaRef&)>;

// Collaborators a session borrows from its controller. All must outlive the session.
struct SessionContext {
    std::shared_ptr<backend::StatePublisher> publisher;
    backend::MemoryResolver* resolver = nullptr;
    backend::MemoryStore* store = nullptr;
    events::EventBus* bus = nullptr;
    util::WorkerPool* io_pool = nullptr;        // nullptr runs blocking work inline
    BackgroundSession* background = nullptr;    // optional
    MetadataReader metadata_reader;             // optional
    collectors::TrackerConfig tracker_config;
};

/**
 * Session: one loaded playlist bound to one engine handle.
 *
 * Created by the controller on load, destroyed on release, never revived.
 * State machine: Idle -> Loaded -> Playing <-> Paused -> Ended, with Loaded
 * re-entered on every track transition.
 *
 * Commands lock the session mutex. Engine events and results of background
 * work are queued and applied in order by process_pending_events() (or
 * run()) under the same mutex. Every call after release() is a logged no-op.
 *
 * EventBus handlers run on the publishing thread while the session (or the
 * tracker) is mid-update; they must not call back into the session.
 */
class Session {
public:
    Session(std::unique_ptr<audio::MediaEngine> engine, SessionContext context);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Resume seek (when a memory exists) completes before play() is issued
    void load(std::shared_ptr<const model::Playlist> playlist, int start_index);

    void play();
    void pause();
    void seek_to(int64_t position_ms);
    void play_at(int index);
    void next();
    void previous();

    void set_play_mode(model::PlayMode mode);
    void toggle_mode();
    void set_audiobook_mode(bool enabled);

    std::optional<model::SavedResult> save_memory_manually();

    // Applies queued engine events and background results; returns how many ran
    size_t process_pending_events();

    // Pumps events until stop is requested or the session is released
    void run(std::stop_token stop_token);

    // Persist once, stop the tracker, release the engine
    void release();

    [[nodiscard]] bool is_released() const { return released_.load(); }

    [[nodiscard]] collectors::PositionTracker& tracker() { return *tracker_; }

private:
    using Task = std::function<void()>;

    bool check_alive(const char* operation) const;

    void handle_event(const audio::EngineEvent& event);
    void on_playing_changed(bool is_playing);
    void on_state_changed(audio::EngineState state);
    void on_transition(int index, const std::string& media_id);

    void apply_play_mode(model::PlayMode mode);
    void resume_for(const model::MediaRef& ref, std::optional<int> index);
    void set_current(int index);
    void request_metadata(const model::MediaRef& ref);
    void request_transition_resume(const model::MediaRef& ref);

    // Snapshot write now; durable write on the I/O pool
    void persist_position();
    // Snapshot and durable write, both before returning
    void persist_position_sync();

    void run_blocking(Task job);
    void publish_state(model::SessionState state);
    void publish_event(events::Event::Type type, std::string data, int index = -1);

    std::unique_ptr<audio::MediaEngine> engine_;
    SessionContext ctx_;
    std::unique_ptr<collectors::PositionTracker> tracker_;

    // Marshaled results; shared so background jobs can outlive the session safely
    std::shared_ptr<util::Channel<Task>> tasks_;

    std::shared_ptr<const model::Playlist> playlist_;
    std::string current_identity_;
    std::string resumed_identity_;
    bool ended_saved_ = false;

    mutable std::mutex mutex_;
    std::atomic<bool> released_{false};
};

}  // namespace reprise::player
