#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>

namespace reprise::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Malformed or out-of-range numbers leave the default in place
template <typename T>
void parse_number(const std::string& key, const std::string& value, T& out, T min_value) {
    T parsed{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size() || parsed < min_value) {
        util::Logger::warn("Config: Ignoring invalid value for " + key + ": " + value);
        return;
    }
    out = parsed;
}

std::filesystem::path expand_home(const std::string& value) {
    if (value.starts_with("~/")) {
        const char* home = std::getenv("HOME");
        if (home) return std::filesystem::path(home) / value.substr(2);
    }
    return std::filesystem::path(value);
}

} // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::debug("Config: Skipping line without '=': " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "playback") {
            if (key == "play_mode") {
                if (auto mode = parse_play_mode(value)) {
                    cfg.play_mode = *mode;
                } else {
                    util::Logger::warn("Config: Unknown play_mode: " + value);
                }
            }
            else if (key == "audiobook_mode") cfg.audiobook_mode = (value == "true");
            else if (key == "tick_interval_ms") parse_number(key, value, cfg.tick_interval_ms, 1);
            else if (key == "durable_save_every_ticks") parse_number(key, value, cfg.durable_save_every_ticks, 1);
            else if (key == "audiobook_save_interval_ms") parse_number(key, value, cfg.audiobook_save_interval_ms, int64_t{1});
        }
        else if (current_section == "library") {
            if (key == "music_directory") cfg.music_directory = expand_home(value);
        }
        else if (current_section == "storage") {
            if (key == "database_path") cfg.database_path = expand_home(value);
            else if (key == "snapshot_path") cfg.snapshot_path = expand_home(value);
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    file << "# REPRISE Config\n\n";

    file << "[playback]\n";
    file << "# Play mode: \"sequential\", \"shuffle\", \"repeat_one\"\n";
    file << "play_mode = \"" << model::to_string(cfg.play_mode) << "\"\n\n";
    file << "# Save position every few minutes and announce it\n";
    file << "audiobook_mode = " << (cfg.audiobook_mode ? "true" : "false") << "\n\n";
    file << "# Position polling interval\n";
    file << "tick_interval_ms = " << cfg.tick_interval_ms << "\n\n";
    file << "# Durable save once every N ticks\n";
    file << "durable_save_every_ticks = " << cfg.durable_save_every_ticks << "\n\n";
    file << "# Audiobook auto-save interval\n";
    file << "audiobook_save_interval_ms = " << cfg.audiobook_save_interval_ms << "\n\n";

    file << "[library]\n";
    if (!cfg.music_directory.empty()) {
        file << "music_directory = \"" << cfg.music_directory.string() << "\"\n\n";
    } else {
        file << "# music_directory = \"~/Music\"\n\n";
    }

    file << "[storage]\n";
    file << "database_path = \"" << cfg.database_path.string() << "\"\n";
    file << "snapshot_path = \"" << cfg.snapshot_path.string() << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

std::optional<model::PlayMode> ConfigLoader::parse_play_mode(const std::string& value) {
    if (value == "sequential") return model::PlayMode::Sequential;
    if (value == "shuffle") return model::PlayMode::Shuffle;
    if (value == "repeat_one") return model::PlayMode::RepeatOne;
    return std::nullopt;
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.music_directory = util::Platform::get_music_directory();
    auto data_dir = util::Platform::get_data_directory();
    cfg.database_path = data_dir / "memories.db";
    cfg.snapshot_path = data_dir / "last_position.snap";
    return cfg;
}

}  // namespace reprise::backend
