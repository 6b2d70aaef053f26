#pragma once

#include "backend/MemoryStore.hpp"
#include "backend/SnapshotStore.hpp"
#include "events/EventBus.hpp"
#include "model/Media.hpp"
#include "model/Snapshot.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reprise::backend {

/**
 * MemoryResolver: the only path between playback and the stores.
 *
 * Resume lookup order:
 *   1. exact file identity in the durable store, or the fast snapshot's
 *      record for the same identity when it is newer (it is written every
 *      tick, the durable store only every few);
 *   2. the most recent durable record with the same normalized display
 *      name. Two files sharing a name in different folders are conflated
 *      by this step; it exists so a memory survives a switch between path
 *      and provider access to the same file.
 *
 * All calls may block on store I/O.
 */
class MemoryResolver {
public:
    MemoryResolver(std::shared_ptr<MemoryStore> store,
                   std::shared_ptr<SnapshotStore> snapshots,
                   events::EventBus* bus = nullptr);

    [[nodiscard]] std::optional<model::PlaybackMemory> resolve_resume(const model::MediaRef& ref) const;

    // Durable upsert only. saved_at is the capture time; 0 stamps it now.
    void save_memory(const model::MediaRef& ref, int64_t position_ms, int64_t duration_ms,
                     const std::string& folder_identity, const std::string& display_name,
                     int64_t saved_at = 0);

    // Fast snapshot only
    void save_snapshot(const model::MediaRef& ref, int64_t position_ms, int64_t duration_ms,
                       const std::string& folder_identity, const std::string& display_name);

    // Durable + snapshot, then MemorySaved(is_auto_save=false). nullopt without a current item.
    std::optional<model::SavedResult> save_memory_manually(const model::Snapshot& state);

    // Publishes MemorySaved on the bus, if any
    void announce(const model::MemorySaveEvent& event);

    // Always inserts; an empty label becomes "Bookmark MM:SS"
    int64_t add_bookmark(const model::MediaRef& ref, int64_t position_ms, int64_t duration_ms,
                         const std::string& label, const std::string& folder_identity,
                         const std::string& display_name);
    void delete_bookmark(int64_t id);
    void rename_bookmark(int64_t id, const std::string& label);
    [[nodiscard]] std::vector<model::Bookmark> bookmarks_for(const std::string& file_identity) const;
    [[nodiscard]] std::vector<model::Bookmark> all_bookmarks() const;

    void delete_memory(const std::string& file_identity);
    void clear_all();
    [[nodiscard]] std::vector<model::PlaybackMemory> all_memories() const;
    [[nodiscard]] std::vector<model::PlaybackMemory> memories_in_folder(const std::string& folder_identity) const;
    [[nodiscard]] std::optional<model::PlaybackMemory> latest_memory() const;

    static std::string default_bookmark_label(int64_t position_ms);

private:
    std::shared_ptr<MemoryStore> store_;
    std::shared_ptr<SnapshotStore> snapshots_;
    events::EventBus* bus_;
};

}  // namespace reprise::backend
