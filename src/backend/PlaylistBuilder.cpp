#include "backend/PlaylistBuilder.hpp"
#include "util/Logger.hpp"
#include <array>
#include <string_view>
#include <utility>

namespace reprise::backend {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 18> MIME_TYPES = {{
    {"mp3", "audio/mpeg"},
    {"wav", "audio/wav"},
    {"m4a", "audio/mp4"},
    {"alac", "audio/mp4"},
    {"m4s", "audio/mp4"},
    {"aac", "audio/aac"},
    {"ogg", "audio/ogg"},
    {"opus", "audio/ogg"},
    {"flac", "audio/flac"},
    {"wma", "audio/x-ms-wma"},
    {"ape", "audio/x-ape"},
    {"mp4", "video/mp4"},
    {"mkv", "video/x-matroska"},
    {"webm", "video/webm"},
    {"avi", "video/x-msvideo"},
    {"mov", "video/quicktime"},
    {"ts", "video/mp2t"},
    {"3gp", "video/3gpp"},
}};

} // namespace

model::Playlist PlaylistBuilder::build(const std::vector<model::MediaRef>& entries,
                                       const std::string& folder_identity,
                                       std::optional<int64_t> playlist_id) {
    model::Playlist playlist;
    playlist.folder_identity = folder_identity;
    playlist.playlist_id = playlist_id;

    if (entries.empty()) {
        return playlist;
    }

    const model::RefKind mode = entries.front().kind();
    std::vector<model::MediaRef> items;
    items.reserve(entries.size());
    size_t dropped = 0;

    for (const auto& ref : entries) {
        if (ref.kind() != mode) {
            ++dropped;
            util::Logger::warn("PlaylistBuilder: Dropping entry of the other access mode: " + ref.identity());
            continue;
        }
        items.push_back(ref);
    }

    if (mode == model::RefKind::Path) {
        playlist.entries = model::PathList{std::move(items)};
    } else {
        playlist.entries = model::UriList{std::move(items)};
    }

    util::Logger::debug("PlaylistBuilder: Built " + std::string(mode == model::RefKind::Path ? "path" : "uri") +
                        " playlist with " + std::to_string(playlist.size()) + " items" +
                        (dropped ? ", dropped " + std::to_string(dropped) : ""));
    return playlist;
}

std::optional<std::string> PlaylistBuilder::resolve_mime(const model::MediaRef& ref) {
    for (const auto& [extension, mime] : MIME_TYPES) {
        if (extension == ref.extension()) {
            return std::string(mime);
        }
    }
    return std::nullopt;
}

std::vector<audio::MediaItem> PlaylistBuilder::to_media_items(const model::Playlist& playlist) {
    std::vector<audio::MediaItem> items;
    items.reserve(playlist.size());
    for (const auto& ref : playlist.items()) {
        items.push_back(audio::MediaItem{ref.identity(), ref.identity(), resolve_mime(ref)});
    }
    return items;
}

}  // namespace reprise::backend
