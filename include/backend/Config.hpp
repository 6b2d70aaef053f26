#pragma once

#include "model/Snapshot.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace reprise::backend {

struct Config {
    // Playback settings
    model::PlayMode play_mode = model::PlayMode::Sequential;
    bool audiobook_mode = false;
    int tick_interval_ms = 300;
    int durable_save_every_ticks = 10;
    int64_t audiobook_save_interval_ms = 300000;

    // Directory settings
    std::filesystem::path music_directory;

    // Storage
    std::filesystem::path database_path;
    std::filesystem::path snapshot_path;
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

    // "sequential", "shuffle", "repeat_one"; nullopt for anything else
    static std::optional<model::PlayMode> parse_play_mode(const std::string& value);

private:
    static Config create_default_config();
};

}  // namespace reprise::backend
