#pragma once

#include "audio/MediaEngine.hpp"
#include "model/Media.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reprise::backend {

class PlaylistBuilder {
public:
    /**
     * Build a single-mode playlist. The first entry decides the mode; entries
     * of the other kind are dropped with a warning so the result is never mixed.
     */
    [[nodiscard]] static model::Playlist build(const std::vector<model::MediaRef>& entries,
                                               const std::string& folder_identity,
                                               std::optional<int64_t> playlist_id = std::nullopt);

    /**
     * Container MIME type for the engine, from the extension.
     * MP4-family audio (m4a, alac, m4s) is the container "audio/mp4";
     * raw aac is "audio/aac". Unknown extensions get no override.
     */
    [[nodiscard]] static std::optional<std::string> resolve_mime(const model::MediaRef& ref);

    // One engine item per entry, media_id = identity. No engine calls.
    [[nodiscard]] static std::vector<audio::MediaItem> to_media_items(const model::Playlist& playlist);
};

}  // namespace reprise::backend
