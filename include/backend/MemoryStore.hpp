#pragma once

#include "model/Records.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reprise::backend {

/// Durable store for playback memories, bookmarks and the playlist registry.
/// Implementations must be thread-safe; calls may block on I/O.
/// Deleting or updating an absent record is not an error.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    // Memories: one record per file identity. An upsert older than the
    // stored record (by saved_at) is ignored.
    virtual void upsert_memory(const model::PlaybackMemory& memory) = 0;
    virtual std::optional<model::PlaybackMemory> get_memory(const std::string& file_identity) = 0;
    // Most recently saved record whose normalized display name matches
    virtual std::optional<model::PlaybackMemory> get_memory_by_display_name(const std::string& display_name) = 0;
    virtual std::optional<model::PlaybackMemory> latest_memory() = 0;
    virtual std::vector<model::PlaybackMemory> all_memories() = 0;          // saved_at descending
    virtual std::vector<model::PlaybackMemory> memories_in_folder(const std::string& folder_identity) = 0;
    virtual void delete_memory(const std::string& file_identity) = 0;
    virtual void delete_all_memories() = 0;

    // Bookmarks: many per file; insert assigns the id
    virtual int64_t insert_bookmark(const model::Bookmark& bookmark) = 0;
    virtual std::optional<model::Bookmark> get_bookmark(int64_t id) = 0;
    virtual std::vector<model::Bookmark> bookmarks_for(const std::string& file_identity) = 0;  // position ascending
    virtual std::vector<model::Bookmark> all_bookmarks() = 0;                                 // created_at descending
    virtual void update_bookmark_label(int64_t id, const std::string& label) = 0;
    virtual void delete_bookmark(int64_t id) = 0;

    // Playlist registry: one record per folder identity; upsert keeps the id
    virtual int64_t upsert_playlist(const model::PlaylistRecord& record) = 0;
    virtual std::optional<model::PlaylistRecord> playlist_by_folder(const std::string& folder_identity) = 0;
    virtual std::vector<model::PlaylistRecord> playlists_by_last_played() = 0;
    virtual void update_playlist_track_count(int64_t id, int track_count) = 0;
    virtual void update_playlist_last_played(int64_t id) = 0;
    virtual void delete_playlist(int64_t id) = 0;
};

}  // namespace reprise::backend
