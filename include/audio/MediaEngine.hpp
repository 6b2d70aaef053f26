#pragma once

#include "util/Channel.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reprise::audio {

struct MediaItem {
    std::string media_id;   // MediaRef identity
    std::string uri;        // Path or provider URI handed to the decoder
    std::optional<std::string> mime_type;

    bool operator==(const MediaItem&) const = default;
};

enum class RepeatMode {
    Off,
    One,
    All,
};

enum class EngineState {
    Idle,
    Buffering,
    Ready,
    Ended,
};

struct IsPlayingChanged {
    bool is_playing = false;
};

struct StateChanged {
    EngineState state = EngineState::Idle;
};

struct Transition {
    int index = -1;
    std::string media_id;
};

using EngineEvent = std::variant<IsPlayingChanged, StateChanged, Transition>;

/// Decoding/rendering engine driven by the session. Implementations live
/// outside this library; the session only talks to this interface.
///
/// Commands are issued from the session's context. current_position_ms()
/// and duration_ms() must also be safe to call from the tracker thread.
/// Events are pushed into events() from whatever thread the engine uses.
class MediaEngine {
public:
    virtual ~MediaEngine() = default;

    virtual void load(const std::vector<MediaItem>& items, int start_index) = 0;
    virtual void prepare() = 0;
    virtual void play() = 0;
    virtual void pause() = 0;

    // Empty index seeks within the current item
    virtual void seek_to(std::optional<int> index, int64_t position_ms) = 0;

    virtual int64_t current_position_ms() const = 0;
    virtual int64_t duration_ms() const = 0;  // 0 while unknown
    virtual int current_index() const = 0;
    virtual bool is_playing() const = 0;

    virtual bool has_next() const = 0;
    virtual bool has_previous() const = 0;
    virtual void seek_to_next() = 0;
    virtual void seek_to_previous() = 0;

    virtual void set_repeat_mode(RepeatMode mode) = 0;
    virtual void set_shuffle(bool enabled) = 0;

    virtual void release() = 0;

    virtual util::Channel<EngineEvent>& events() = 0;
};

using EngineFactory = std::function<std::unique_ptr<MediaEngine>()>;

} // namespace reprise::audio
