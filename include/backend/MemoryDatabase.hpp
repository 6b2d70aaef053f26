#pragma once

#include "backend/MemoryStore.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <unordered_map>

namespace reprise::backend {

/**
 * MemoryDatabase: local MemoryStore.
 *
 * Tables live in memory behind one mutex. When constructed with a path the
 * whole database is loaded from that file and rewritten after every
 * mutation (temp file + rename, so a crash leaves the old or the new file,
 * never a torn one). Without a path it is purely in-memory.
 *
 * File layout: magic 'RPRS', version, then memories, bookmarks and
 * playlists as counted records of length-prefixed strings and int64s.
 */
class MemoryDatabase : public MemoryStore {
public:
    MemoryDatabase();
    explicit MemoryDatabase(std::filesystem::path path);

    MemoryDatabase(const MemoryDatabase&) = delete;
    MemoryDatabase& operator=(const MemoryDatabase&) = delete;

    void upsert_memory(const model::PlaybackMemory& memory) override;
    std::optional<model::PlaybackMemory> get_memory(const std::string& file_identity) override;
    std::optional<model::PlaybackMemory> get_memory_by_display_name(const std::string& display_name) override;
    std::optional<model::PlaybackMemory> latest_memory() override;
    std::vector<model::PlaybackMemory> all_memories() override;
    std::vector<model::PlaybackMemory> memories_in_folder(const std::string& folder_identity) override;
    void delete_memory(const std::string& file_identity) override;
    void delete_all_memories() override;

    int64_t insert_bookmark(const model::Bookmark& bookmark) override;
    std::optional<model::Bookmark> get_bookmark(int64_t id) override;
    std::vector<model::Bookmark> bookmarks_for(const std::string& file_identity) override;
    std::vector<model::Bookmark> all_bookmarks() override;
    void update_bookmark_label(int64_t id, const std::string& label) override;
    void delete_bookmark(int64_t id) override;

    int64_t upsert_playlist(const model::PlaylistRecord& record) override;
    std::optional<model::PlaylistRecord> playlist_by_folder(const std::string& folder_identity) override;
    std::vector<model::PlaylistRecord> playlists_by_last_played() override;
    void update_playlist_track_count(int64_t id, int track_count) override;
    void update_playlist_last_played(int64_t id) override;
    void delete_playlist(int64_t id) override;

    [[nodiscard]] bool is_persistent() const { return !path_.empty(); }

private:
    struct StoredMemory {
        model::PlaybackMemory memory;
        std::string normalized_name;
    };

    void load();
    void save_locked() const;

    std::unordered_map<std::string, StoredMemory> memories_;
    std::map<int64_t, model::Bookmark> bookmarks_;
    std::map<int64_t, model::PlaylistRecord> playlists_;
    int64_t next_bookmark_id_ = 1;
    int64_t next_playlist_id_ = 1;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

}  // namespace reprise::backend
