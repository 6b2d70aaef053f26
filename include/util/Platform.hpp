#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace reprise::util {

class Platform {
public:
    static std::filesystem::path get_music_directory();
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_data_directory();

    // Audio containers first, then video containers played for their audio track.
    // "m4s" is the fragment of a segmented MP4 stream.
    static constexpr std::array<std::string_view, 18> MEDIA_EXTENSIONS = {
        "mp3", "wav", "m4a", "ogg", "flac", "aac", "wma", "opus", "ape", "alac", "m4s",
        "mp4", "mkv", "webm", "avi", "mov", "ts", "3gp"
    };

    // Case-insensitive; accepts the extension with or without the leading dot
    [[nodiscard]] static bool is_media_extension(std::string_view extension);

    // Lower-cased extension without the dot ("" when the name has none)
    [[nodiscard]] static std::string extension_of(std::string_view file_name);

    // File name with the last extension stripped
    [[nodiscard]] static std::string stem_of(std::string_view file_name);

    // "file:///music/a.mp3" -> "/music/a.mp3"; nullopt for other schemes
    [[nodiscard]] static std::optional<std::string> local_path_from_uri(const std::string& uri);

    [[nodiscard]] static int64_t now_epoch_ms();
};

}  // namespace reprise::util
