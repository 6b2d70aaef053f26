#pragma once

#include "model/Records.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace reprise::backend {

/// Fast key-value snapshot of the last playback position. Written on every
/// tracker tick, so put() must be cheap; only the last record is kept.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual void put(const std::string& file_identity, int64_t position_ms, int64_t duration_ms,
                     const std::string& folder_identity, const std::string& display_name) = 0;

    virtual std::optional<model::PlaybackMemory> last() = 0;

    // Drops the record if it belongs to file_identity
    virtual void erase(const std::string& file_identity) = 0;
    virtual void clear() = 0;
};

}  // namespace reprise::backend
