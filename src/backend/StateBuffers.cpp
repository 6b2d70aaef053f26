#include "backend/StateBuffers.hpp"

namespace reprise::backend {

StateBuffers::StateBuffers() {
    auto empty_playlist = std::make_shared<const model::Playlist>();

    a_.playlist = empty_playlist;
    a_.seq = 0;

    b_.playlist = empty_playlist;
    b_.seq = 0;

    front_.store(&a_);
    back_ = &b_;
}

model::Snapshot& StateBuffers::back() {
    return *back_;
}

void StateBuffers::publish() {
    // 1. Update sequence
    back_->seq = front_.load(std::memory_order_acquire)->seq + 1;

    // 2. Swap pointers
    auto* old_front = front_.load(std::memory_order_relaxed);
    front_.store(back_, std::memory_order_release);
    back_ = old_front;

    // 3. Re-sync the new back buffer so the next producer starts from the latest state
    *back_ = *front_.load(std::memory_order_acquire);
}

const model::Snapshot& StateBuffers::front() const {
    return *front_.load(std::memory_order_acquire);
}

uint64_t StateBuffers::seq() const {
    return front().seq;
}

}  // namespace reprise::backend
