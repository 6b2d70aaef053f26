#pragma once

#include "model/Records.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reprise::events {

struct Event {
    enum class Type {
        MemorySaved,           // memory carries the saved position
        TrackChanged,          // index + data = identity of the new current item
        PlaylistChanged,       // data = folder identity
        PlayModeChanged,       // data = play mode name
        PlaybackStateChanged,  // data = session state name
    };
    Type type;
    int index = -1;
    std::string data;
    std::optional<model::MemorySaveEvent> memory;
};

/// Synchronous fan-out. Handlers run on the publishing thread, outside the
/// bus lock, so a handler may subscribe or unsubscribe.
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(Event::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const Event& event);

private:
    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };

    std::map<Event::Type, std::vector<Subscription>> subscribers_;
    SubscriptionId next_id_ = 1;
    std::mutex mutex_;
};

}  // namespace reprise::events
