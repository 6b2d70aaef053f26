#pragma once

#include <cstdint>
#include <string>

namespace reprise::model {

/// "Where the user left off" for one file. One record per file identity.
struct PlaybackMemory {
    std::string file_identity;
    int64_t position_ms = 0;
    int64_t duration_ms = 0;
    std::string folder_identity;
    std::string display_name;
    int64_t saved_at = 0;  // Epoch ms

    bool operator==(const PlaybackMemory&) const = default;
};

struct Bookmark {
    int64_t id = 0;
    std::string file_identity;
    int64_t position_ms = 0;
    int64_t duration_ms = 0;
    std::string label;
    int64_t created_at = 0;  // Epoch ms
    std::string folder_identity;
    std::string display_name;

    bool operator==(const Bookmark&) const = default;
};

/// One imported folder. folder_identity is unique across records.
struct PlaylistRecord {
    int64_t id = 0;
    std::string folder_identity;
    std::string name;
    int track_count = 0;
    int64_t imported_at = 0;
    int64_t last_played_at = 0;  // 0 = never played

    bool operator==(const PlaylistRecord&) const = default;
};

struct MemorySaveEvent {
    std::string file_identity;
    int64_t position_ms = 0;
    std::string display_name;
    bool is_auto_save = false;

    bool operator==(const MemorySaveEvent&) const = default;
};

struct SavedResult {
    std::string file_identity;
    int64_t position_ms = 0;
    int64_t duration_ms = 0;
    std::string display_name;

    bool operator==(const SavedResult&) const = default;
};

struct TrackMetadata {
    std::string title;
    std::string artist;
    std::string album;
    int64_t duration_ms = 0;
    bool is_valid = true;
    std::string error;

    bool operator==(const TrackMetadata&) const = default;
};

} // namespace reprise::model
