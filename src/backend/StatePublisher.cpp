#include "backend/StatePublisher.hpp"

namespace reprise::backend {

StatePublisher::StatePublisher() = default;

StatePublisher::~StatePublisher() = default;

void StatePublisher::publish(model::Snapshot snap) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Copies the lightweight structure; the playlist is shared, not copied
    buffers_.back() = std::move(snap);
    buffers_.publish();
}

void StatePublisher::update(const std::function<void(model::Snapshot&)>& updater) {
    // Not logged: called on every tracker tick
    std::lock_guard<std::mutex> lock(mutex_);
    updater(buffers_.back());
    buffers_.publish();
}

// The read copies under the same lock as the writer, because publish()
// re-syncs the retired front buffer in place.
std::shared_ptr<const model::Snapshot> StatePublisher::get_current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_shared<model::Snapshot>(buffers_.front());
}

}  // namespace reprise::backend
