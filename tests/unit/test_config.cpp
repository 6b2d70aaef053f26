#include "../framework/SimpleTest.hpp"
#include "backend/Config.hpp"
#include "player/PlaybackController.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace reprise::backend;
using reprise::model::PlayMode;

namespace fs = std::filesystem;

namespace {

fs::path write_config(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST_CASE(test_defaults_without_file) {
    auto cfg = ConfigLoader::load_from_file("/nonexistent/reprise/config.toml");
    ASSERT_TRUE(cfg.play_mode == PlayMode::Sequential);
    ASSERT_FALSE(cfg.audiobook_mode);
    ASSERT_EQ(cfg.tick_interval_ms, 300);
    ASSERT_EQ(cfg.durable_save_every_ticks, 10);
    ASSERT_EQ(cfg.audiobook_save_interval_ms, 300000);
    ASSERT_EQ(cfg.database_path.filename().string(), "memories.db");
    ASSERT_EQ(cfg.snapshot_path.filename().string(), "last_position.snap");
}

TEST_CASE(test_parse_sections) {
    auto path = write_config("reprise_test_config.toml",
        "# comment\n"
        "[playback]\n"
        "play_mode = \"repeat_one\"\n"
        "audiobook_mode = true\n"
        "tick_interval_ms = 500\n"
        "durable_save_every_ticks = 4\n"
        "audiobook_save_interval_ms = 60000\n"
        "\n"
        "[library]\n"
        "music_directory = \"/srv/audiobooks\"\n"
        "\n"
        "[storage]\n"
        "database_path = \"/var/tmp/r/m.db\"\n"
        "snapshot_path = /var/tmp/r/s.snap\n");

    auto cfg = ConfigLoader::load_from_file(path);
    ASSERT_TRUE(cfg.play_mode == PlayMode::RepeatOne);
    ASSERT_TRUE(cfg.audiobook_mode);
    ASSERT_EQ(cfg.tick_interval_ms, 500);
    ASSERT_EQ(cfg.durable_save_every_ticks, 4);
    ASSERT_EQ(cfg.audiobook_save_interval_ms, 60000);
    ASSERT_EQ(cfg.music_directory.string(), "/srv/audiobooks");
    ASSERT_EQ(cfg.database_path.string(), "/var/tmp/r/m.db");
    ASSERT_EQ(cfg.snapshot_path.string(), "/var/tmp/r/s.snap");

    fs::remove(path);
}

TEST_CASE(test_invalid_values_keep_defaults) {
    auto path = write_config("reprise_test_bad_config.toml",
        "[playback]\n"
        "play_mode = \"random\"\n"
        "tick_interval_ms = fast\n"
        "durable_save_every_ticks = 0\n"
        "audiobook_save_interval_ms = 12abc\n"
        "no equals sign here\n");

    auto cfg = ConfigLoader::load_from_file(path);
    ASSERT_TRUE(cfg.play_mode == PlayMode::Sequential);
    ASSERT_EQ(cfg.tick_interval_ms, 300);
    ASSERT_EQ(cfg.durable_save_every_ticks, 10);
    ASSERT_EQ(cfg.audiobook_save_interval_ms, 300000);

    fs::remove(path);
}

TEST_CASE(test_home_expansion) {
    const char* home = std::getenv("HOME");
    if (!home) return;

    auto path = write_config("reprise_test_home_config.toml",
        "[library]\nmusic_directory = \"~/Books\"\n");
    auto cfg = ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.music_directory, fs::path(home) / "Books");

    fs::remove(path);
}

TEST_CASE(test_save_then_load) {
    Config cfg;
    cfg.play_mode = PlayMode::Shuffle;
    cfg.audiobook_mode = true;
    cfg.tick_interval_ms = 250;
    cfg.music_directory = "/srv/music";
    cfg.database_path = "/var/tmp/reprise/m.db";
    cfg.snapshot_path = "/var/tmp/reprise/s.snap";

    fs::path path = fs::temp_directory_path() / "reprise_test_saved" / "config.toml";
    ASSERT_TRUE(ConfigLoader::save_config(cfg, path));

    auto loaded = ConfigLoader::load_from_file(path);
    ASSERT_TRUE(loaded.play_mode == PlayMode::Shuffle);
    ASSERT_TRUE(loaded.audiobook_mode);
    ASSERT_EQ(loaded.tick_interval_ms, 250);
    ASSERT_EQ(loaded.music_directory.string(), "/srv/music");
    ASSERT_EQ(loaded.database_path.string(), "/var/tmp/reprise/m.db");

    fs::remove_all(path.parent_path());
}

TEST_CASE(test_parse_play_mode_names) {
    ASSERT_TRUE(ConfigLoader::parse_play_mode("sequential") == PlayMode::Sequential);
    ASSERT_TRUE(ConfigLoader::parse_play_mode("shuffle") == PlayMode::Shuffle);
    ASSERT_TRUE(ConfigLoader::parse_play_mode("repeat_one") == PlayMode::RepeatOne);
    ASSERT_FALSE(ConfigLoader::parse_play_mode("Shuffle").has_value());
}

TEST_CASE(test_controller_options_from_config) {
    Config cfg;
    cfg.play_mode = PlayMode::RepeatOne;
    cfg.audiobook_mode = true;
    cfg.tick_interval_ms = 200;
    cfg.durable_save_every_ticks = 5;
    cfg.audiobook_save_interval_ms = 90000;

    auto options = reprise::player::ControllerOptions::from_config(cfg);
    ASSERT_TRUE(options.play_mode == PlayMode::RepeatOne);
    ASSERT_TRUE(options.audiobook_mode);
    ASSERT_EQ(options.tracker_config.tick_interval.count(), 200);
    ASSERT_EQ(options.tracker_config.durable_save_every_ticks, 5);
    ASSERT_EQ(options.tracker_config.audiobook_save_interval_ms, 90000);
}

int main() {
    return reprise::test::TestRunner::instance().run_all();
}
