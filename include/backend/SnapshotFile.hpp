#pragma once

#include "backend/SnapshotStore.hpp"

#include <filesystem>
#include <mutex>

namespace reprise::backend {

/// Local SnapshotStore. Keeps the last record in memory and mirrors it to
/// a small file followed by its SHA-256 digest; a file whose digest does
/// not match (torn write) is ignored on load. Without a path it only
/// keeps the record in memory.
class SnapshotFile : public SnapshotStore {
public:
    SnapshotFile();
    explicit SnapshotFile(std::filesystem::path path);

    void put(const std::string& file_identity, int64_t position_ms, int64_t duration_ms,
             const std::string& folder_identity, const std::string& display_name) override;

    std::optional<model::PlaybackMemory> last() override;

    void erase(const std::string& file_identity) override;
    void clear() override;

private:
    void load();
    void write_locked(const model::PlaybackMemory& record) const;
    void clear_locked();

    std::optional<model::PlaybackMemory> last_;
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

}  // namespace reprise::backend
