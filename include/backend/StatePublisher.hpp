#pragma once

#include "model/Snapshot.hpp"
#include "backend/StateBuffers.hpp"
#include <functional>
#include <memory>
#include <mutex>

namespace reprise::backend {

/// Single writer path for the observable playback state. Each update()
/// edits a private copy and publishes it as a whole, so readers never see
/// a half-applied change (playlist and folder identity swap together).
class StatePublisher {
public:
    StatePublisher();
    ~StatePublisher();

    void publish(model::Snapshot snap);
    void update(const std::function<void(model::Snapshot&)>& updater);

    // Copy of the latest published snapshot
    [[nodiscard]] std::shared_ptr<const model::Snapshot> get_current() const;

private:
    StateBuffers buffers_;
    mutable std::mutex mutex_;
};

}  // namespace reprise::backend
