#include "player/Session.hpp"
#include "backend/PlaylistBuilder.hpp"
#include "util/Formatting.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <chrono>
#include <exception>
#include <type_traits>

namespace reprise::player {

using util::Logger;

namespace {

// A transition resume is skipped once the user has moved past this point
constexpr int64_t TRANSITION_RESUME_WINDOW_MS = 1500;
// Memories this close to the end restart the item instead
constexpr int64_t RESUME_TAIL_MS = 2000;

} // namespace

Session::Session(std::unique_ptr<audio::MediaEngine> engine, SessionContext context)
    : engine_(std::move(engine)),
      ctx_(std::move(context)),
      tasks_(std::make_shared<util::Channel<Task>>()) {
    tracker_ = std::make_unique<collectors::PositionTracker>(
        *engine_, ctx_.publisher, *ctx_.resolver, ctx_.tracker_config);
    Logger::debug("Session: Created");
}

Session::~Session() {
    release();
}

bool Session::check_alive(const char* operation) const {
    if (released_.load()) {
        Logger::debug(std::string("Session: ") + operation + " after release ignored");
        return false;
    }
    return true;
}

// ---- Commands ----

void Session::load(std::shared_ptr<const model::Playlist> playlist, int start_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("load")) return;

    if (!playlist || playlist->empty()) {
        Logger::warn("Session: Refusing to load an empty playlist");
        return;
    }

    if (start_index < 0 || static_cast<size_t>(start_index) >= playlist->size()) {
        Logger::warn("Session: Start index " + std::to_string(start_index) + " out of range, using 0");
        start_index = 0;
    }

    tracker_->stop();
    playlist_ = std::move(playlist);
    const model::MediaRef& ref = *playlist_->at(start_index);

    Logger::info("Session: Loading " + std::to_string(playlist_->size()) + " items from " +
                 playlist_->folder_identity + ", starting at " + ref.display_name());

    // List and folder identity change in the same published update
    ctx_.publisher->update([&](model::Snapshot& s) {
        s.playlist = playlist_;
        s.folder_identity = playlist_->folder_identity;
        s.current_index = start_index;
        s.current_ref = ref;
        s.display_name = ref.display_name();
        s.position_ms = 0;
        s.duration_ms = 0;
        s.is_playing = false;
        s.session_state = model::SessionState::Loaded;
        s.metadata = {};
    });
    current_identity_ = ref.identity();
    resumed_identity_.clear();
    ended_saved_ = false;

    publish_event(events::Event::Type::PlaylistChanged, playlist_->folder_identity);
    publish_event(events::Event::Type::TrackChanged, ref.identity(), start_index);

    engine_->load(backend::PlaylistBuilder::to_media_items(*playlist_), start_index);
    engine_->prepare();
    apply_play_mode(ctx_.publisher->get_current()->play_mode);

    resume_for(ref, std::nullopt);

    if (playlist_->playlist_id && ctx_.store) {
        auto* store = ctx_.store;
        int64_t id = *playlist_->playlist_id;
        run_blocking([store, id]() { store->update_playlist_last_played(id); });
    }

    request_metadata(ref);
    engine_->play();
}

void Session::play() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("play")) return;
    engine_->play();
}

void Session::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("pause")) return;
    persist_position();
    engine_->pause();
}

void Session::seek_to(int64_t position_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("seek_to")) return;
    if (position_ms < 0) position_ms = 0;
    engine_->seek_to(std::nullopt, position_ms);
    ctx_.publisher->update([&](model::Snapshot& s) { s.position_ms = position_ms; });
}

void Session::play_at(int index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("play_at")) return;

    const model::MediaRef* ref = playlist_ ? playlist_->at(index) : nullptr;
    if (!ref) {
        Logger::warn("Session: play_at index " + std::to_string(index) + " out of range");
        return;
    }

    persist_position();
    engine_->seek_to(index, 0);
    set_current(index);
    resume_for(*ref, index);
    request_metadata(*ref);
    engine_->play();
}

void Session::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("next")) return;
    if (!engine_->has_next()) {
        Logger::debug("Session: No next item");
        return;
    }
    persist_position();
    engine_->seek_to_next();
}

void Session::previous() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("previous")) return;
    if (!engine_->has_previous()) {
        Logger::debug("Session: No previous item");
        return;
    }
    persist_position();
    engine_->seek_to_previous();
}

void Session::set_play_mode(model::PlayMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("set_play_mode")) return;
    ctx_.publisher->update([mode](model::Snapshot& s) { s.play_mode = mode; });
    apply_play_mode(mode);
    publish_event(events::Event::Type::PlayModeChanged, model::to_string(mode));
}

void Session::toggle_mode() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("toggle_mode")) return;
    model::PlayMode mode = model::next_play_mode(ctx_.publisher->get_current()->play_mode);
    ctx_.publisher->update([mode](model::Snapshot& s) { s.play_mode = mode; });
    apply_play_mode(mode);
    publish_event(events::Event::Type::PlayModeChanged, model::to_string(mode));
}

void Session::set_audiobook_mode(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("set_audiobook_mode")) return;
    ctx_.publisher->update([enabled](model::Snapshot& s) { s.audiobook_mode = enabled; });
    tracker_->reset_audiobook_accumulator();
    Logger::info(std::string("Session: Audiobook mode ") + (enabled ? "on" : "off"));
}

std::optional<model::SavedResult> Session::save_memory_manually() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_alive("save_memory_manually")) return std::nullopt;

    int64_t position = engine_->current_position_ms();
    int64_t duration = engine_->duration_ms();
    ctx_.publisher->update([&](model::Snapshot& s) {
        s.position_ms = position;
        if (duration > 0) s.duration_ms = duration;
    });
    return ctx_.resolver->save_memory_manually(*ctx_.publisher->get_current());
}

void Session::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_.exchange(true)) return;

    Logger::info("Session: Releasing");

    // The one save that happens on the way out, before anything is cancelled
    persist_position_sync();

    tracker_->stop();
    tasks_->close();

    try {
        engine_->release();
    } catch (const std::exception& e) {
        Logger::error("Session: Engine release failed: " + std::string(e.what()));
    }

    ctx_.publisher->update([](model::Snapshot& s) {
        s.is_playing = false;
        s.session_state = model::SessionState::Idle;
    });
    publish_event(events::Event::Type::PlaybackStateChanged, model::to_string(model::SessionState::Idle));
}

// ---- Event context ----

size_t Session::process_pending_events() {
    size_t handled = 0;
    while (true) {
        if (auto event = engine_->events().try_pop()) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (released_.load()) continue;
            handle_event(*event);
            ++handled;
            continue;
        }
        if (auto task = tasks_->try_pop()) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (released_.load()) continue;
            (*task)();
            ++handled;
            continue;
        }
        break;
    }
    return handled;
}

void Session::run(std::stop_token stop_token) {
    Logger::debug("Session: Event loop started");
    while (!stop_token.stop_requested() && !released_.load()) {
        if (auto event = engine_->events().pop_for(std::chrono::milliseconds(20), stop_token)) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!released_.load()) handle_event(*event);
        }
        process_pending_events();
    }
    Logger::debug("Session: Event loop finished");
}

void Session::handle_event(const audio::EngineEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, audio::IsPlayingChanged>) {
            on_playing_changed(e.is_playing);
        } else if constexpr (std::is_same_v<T, audio::StateChanged>) {
            on_state_changed(e.state);
        } else if constexpr (std::is_same_v<T, audio::Transition>) {
            on_transition(e.index, e.media_id);
        }
    }, event);
}

void Session::on_playing_changed(bool is_playing) {
    if (is_playing) {
        ctx_.publisher->update([](model::Snapshot& s) {
            s.is_playing = true;
            s.session_state = model::SessionState::Playing;
        });
        tracker_->start();

        if (ctx_.background) {
            try {
                ctx_.background->ensure_active();
            } catch (const std::exception& e) {
                Logger::warn("Session: Background session refused: " + std::string(e.what()));
            }
        }
        publish_event(events::Event::Type::PlaybackStateChanged, model::to_string(model::SessionState::Playing));
        return;
    }

    tracker_->stop();
    model::SessionState state = model::SessionState::Paused;
    ctx_.publisher->update([&state](model::Snapshot& s) {
        s.is_playing = false;
        if (s.session_state == model::SessionState::Ended) {
            state = model::SessionState::Ended;
        } else {
            s.session_state = model::SessionState::Paused;
        }
    });
    if (state != model::SessionState::Ended) {
        persist_position();
    }
    publish_event(events::Event::Type::PlaybackStateChanged, model::to_string(state));
}

void Session::on_state_changed(audio::EngineState state) {
    switch (state) {
        case audio::EngineState::Ready: {
            int64_t duration = engine_->duration_ms();
            if (duration > 0) {
                ctx_.publisher->update([duration](model::Snapshot& s) { s.duration_ms = duration; });
            }
            break;
        }
        case audio::EngineState::Ended:
            tracker_->stop();
            if (!ended_saved_) {
                ended_saved_ = true;
                persist_position();
            }
            publish_state(model::SessionState::Ended);
            break;
        case audio::EngineState::Idle:
        case audio::EngineState::Buffering:
            break;
    }
}

void Session::on_transition(int index, const std::string& media_id) {
    if (!playlist_) return;

    // Ids are identities, so a stale index can be corrected by search
    const model::MediaRef* ref = playlist_->at(index);
    if (!ref || ref->identity() != media_id) {
        ref = nullptr;
        const auto& items = playlist_->items();
        for (size_t i = 0; i < items.size(); ++i) {
            if (items[i].identity() == media_id) {
                index = static_cast<int>(i);
                ref = &items[i];
                break;
            }
        }
    }
    if (!ref) {
        Logger::warn("Session: Transition to unknown item " + media_id);
        return;
    }

    if (ref->identity() == current_identity_) {
        // Repeat of the current item, or the transition a command already applied
        ctx_.publisher->update([index](model::Snapshot& s) { s.current_index = index; });
        ended_saved_ = false;
        return;
    }

    Logger::info("Session: Transition to [" + std::to_string(index) + "] " + ref->display_name());
    set_current(index);
    request_metadata(*ref);
    if (resumed_identity_ != ref->identity()) {
        request_transition_resume(*ref);
    }
}

// ---- Helpers ----

void Session::apply_play_mode(model::PlayMode mode) {
    switch (mode) {
        case model::PlayMode::Sequential:
            engine_->set_repeat_mode(audio::RepeatMode::All);
            engine_->set_shuffle(false);
            break;
        case model::PlayMode::Shuffle:
            engine_->set_repeat_mode(audio::RepeatMode::All);
            engine_->set_shuffle(true);
            break;
        case model::PlayMode::RepeatOne:
            engine_->set_repeat_mode(audio::RepeatMode::One);
            engine_->set_shuffle(false);
            break;
    }
}

void Session::resume_for(const model::MediaRef& ref, std::optional<int> index) {
    resumed_identity_ = ref.identity();

    auto memory = ctx_.resolver->resolve_resume(ref);
    if (!memory || memory->position_ms <= 0) {
        return;
    }

    int64_t position = memory->position_ms;
    engine_->seek_to(index, position);
    ctx_.publisher->update([&](model::Snapshot& s) {
        s.position_ms = position;
        if (s.duration_ms == 0 && memory->duration_ms > 0) s.duration_ms = memory->duration_ms;
    });
    Logger::info("Session: Resuming " + ref.display_name() + " at " + util::format_time(position));
}

void Session::set_current(int index) {
    const model::MediaRef* ref = playlist_->at(index);
    if (!ref) return;

    ctx_.publisher->update([&](model::Snapshot& s) {
        s.current_index = index;
        s.current_ref = *ref;
        s.display_name = ref->display_name();
        s.position_ms = 0;
        s.duration_ms = 0;
        s.session_state = model::SessionState::Loaded;
        s.metadata = {};
    });
    current_identity_ = ref->identity();
    ended_saved_ = false;
    publish_event(events::Event::Type::TrackChanged, ref->identity(), index);
}

void Session::request_metadata(const model::MediaRef& ref) {
    if (!ctx_.metadata_reader) return;

    std::weak_ptr<util::Channel<Task>> tasks = tasks_;
    MetadataReader reader = ctx_.metadata_reader;
    run_blocking([this, tasks, reader, ref]() {
        model::TrackMetadata meta = reader(ref);
        auto channel = tasks.lock();
        if (!channel) return;
        channel->push([this, ref, meta]() {
            if (current_identity_ != ref.identity()) {
                Logger::debug("Session: Dropping stale metadata for " + ref.identity());
                return;
            }
            ctx_.publisher->update([&meta](model::Snapshot& s) {
                s.metadata = meta;
                if (s.duration_ms == 0 && meta.duration_ms > 0) s.duration_ms = meta.duration_ms;
            });
        });
    });
}

void Session::request_transition_resume(const model::MediaRef& ref) {
    std::weak_ptr<util::Channel<Task>> tasks = tasks_;
    backend::MemoryResolver* resolver = ctx_.resolver;
    run_blocking([this, tasks, resolver, ref]() {
        auto memory = resolver->resolve_resume(ref);
        auto channel = tasks.lock();
        if (!channel) return;
        channel->push([this, ref, memory]() {
            if (current_identity_ != ref.identity()) {
                Logger::debug("Session: Dropping stale resume for " + ref.identity());
                return;
            }
            resumed_identity_ = ref.identity();
            if (!memory || memory->position_ms <= 0) return;

            if (memory->duration_ms > 0 && memory->position_ms >= memory->duration_ms - RESUME_TAIL_MS) {
                Logger::debug("Session: Memory for " + ref.identity() + " is at the end, starting over");
                return;
            }
            if (engine_->current_position_ms() > TRANSITION_RESUME_WINDOW_MS) {
                Logger::debug("Session: Position already moved, not resuming " + ref.identity());
                return;
            }

            int64_t position = memory->position_ms;
            engine_->seek_to(std::nullopt, position);
            ctx_.publisher->update([position](model::Snapshot& s) { s.position_ms = position; });
            Logger::info("Session: Resuming " + ref.display_name() + " at " + util::format_time(position));
        });
    });
}

void Session::persist_position() {
    auto snap = ctx_.publisher->get_current();
    if (!snap->current_ref) return;

    const model::MediaRef ref = *snap->current_ref;
    int64_t position = engine_->current_position_ms();
    int64_t duration = engine_->duration_ms() > 0 ? engine_->duration_ms() : snap->duration_ms;
    // saved_at is the capture time; pool jobs may run out of order
    int64_t captured_at = util::Platform::now_epoch_ms();
    ctx_.publisher->update([position](model::Snapshot& s) { s.position_ms = position; });

    ctx_.resolver->save_snapshot(ref, position, duration, snap->folder_identity, snap->display_name);

    auto* resolver = ctx_.resolver;
    std::string folder = snap->folder_identity;
    std::string name = snap->display_name;
    run_blocking([resolver, ref, position, duration, folder, name, captured_at]() {
        resolver->save_memory(ref, position, duration, folder, name, captured_at);
    });
}

void Session::persist_position_sync() {
    auto snap = ctx_.publisher->get_current();
    if (!snap->current_ref) return;

    const model::MediaRef& ref = *snap->current_ref;
    int64_t position = engine_->current_position_ms();
    int64_t duration = engine_->duration_ms() > 0 ? engine_->duration_ms() : snap->duration_ms;
    ctx_.publisher->update([position](model::Snapshot& s) { s.position_ms = position; });

    ctx_.resolver->save_snapshot(ref, position, duration, snap->folder_identity, snap->display_name);
    ctx_.resolver->save_memory(ref, position, duration, snap->folder_identity, snap->display_name);
    Logger::debug("Session: Saved " + ref.identity() + " at " + std::to_string(position) + "ms");
}

void Session::run_blocking(Task job) {
    if (ctx_.io_pool && ctx_.io_pool->submit_job(job)) {
        return;
    }
    // No pool, or the pool is shutting down: do it here
    try {
        job();
    } catch (const std::exception& e) {
        Logger::error("Session: Background job failed: " + std::string(e.what()));
    }
}

void Session::publish_state(model::SessionState state) {
    ctx_.publisher->update([state](model::Snapshot& s) { s.session_state = state; });
    publish_event(events::Event::Type::PlaybackStateChanged, model::to_string(state));
}

void Session::publish_event(events::Event::Type type, std::string data, int index) {
    if (!ctx_.bus) return;
    events::Event event{type};
    event.index = index;
    event.data = std::move(data);
    ctx_.bus->publish(event);
}

}  // namespace reprise::player
