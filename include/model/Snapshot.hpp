#pragma once

#include "model/Media.hpp"
#include "model/Records.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace reprise::model {

enum class PlayMode {
    Sequential,  // Repeat all, no shuffle
    Shuffle,     // Repeat all, shuffled
    RepeatOne,
};

enum class SessionState {
    Idle,
    Loaded,
    Playing,
    Paused,
    Ended,
};

/// Immutable view of the playback state handed to observers.
///
/// The playlist is shared via shared_ptr so copying a snapshot on every
/// tick never copies the queue. Playlist replacement swaps the pointer and
/// folder_identity in the same update.
///
/// All updates are serialized by StatePublisher; readers get whole snapshots.
struct Snapshot {
    uint64_t seq = 0;

    SessionState session_state = SessionState::Idle;
    std::optional<MediaRef> current_ref;
    std::string display_name;
    std::string folder_identity;
    int64_t position_ms = 0;
    int64_t duration_ms = 0;
    bool is_playing = false;
    PlayMode play_mode = PlayMode::Sequential;
    bool audiobook_mode = false;
    int current_index = -1;

    std::shared_ptr<const Playlist> playlist;
    TrackMetadata metadata;

    bool operator==(const Snapshot&) const = default;
};

// Sequential -> Shuffle -> RepeatOne -> Sequential
inline PlayMode next_play_mode(PlayMode mode) {
    switch (mode) {
        case PlayMode::Sequential: return PlayMode::Shuffle;
        case PlayMode::Shuffle: return PlayMode::RepeatOne;
        case PlayMode::RepeatOne: return PlayMode::Sequential;
    }
    return PlayMode::Sequential;
}

inline const char* to_string(PlayMode mode) {
    switch (mode) {
        case PlayMode::Sequential: return "sequential";
        case PlayMode::Shuffle: return "shuffle";
        case PlayMode::RepeatOne: return "repeat_one";
    }
    return "sequential";
}

inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Loaded: return "loaded";
        case SessionState::Playing: return "playing";
        case SessionState::Paused: return "paused";
        case SessionState::Ended: return "ended";
    }
    return "idle";
}

} // namespace reprise::model
