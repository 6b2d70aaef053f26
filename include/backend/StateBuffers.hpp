#pragma once

#include "model/Snapshot.hpp"
#include <atomic>
#include <cstdint>

namespace reprise::backend {

// Ping-pong pair of snapshots. The producer edits back(), publish() swaps
// and carries the published state forward into the new back buffer.
// Callers serialize producers and readers (StatePublisher holds the lock).
class StateBuffers {
public:
    StateBuffers();

    StateBuffers(const StateBuffers&) = delete;
    StateBuffers& operator=(const StateBuffers&) = delete;

    [[nodiscard]] model::Snapshot& back();

    // Swap front/back buffers and increment sequence
    void publish();

    [[nodiscard]] const model::Snapshot& front() const;

    [[nodiscard]] uint64_t seq() const;

private:
    model::Snapshot a_;
    model::Snapshot b_;

    std::atomic<model::Snapshot*> front_;
    model::Snapshot* back_;
};

}  // namespace reprise::backend
