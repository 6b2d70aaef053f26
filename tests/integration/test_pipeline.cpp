#include "../framework/SimpleTest.hpp"
#include "../fakes/FakeEngine.hpp"
#include "../fakes/FakeProvider.hpp"
#include "backend/MemoryDatabase.hpp"
#include "backend/MetadataParser.hpp"
#include "backend/SnapshotFile.hpp"
#include "player/PlaybackController.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>
#include <vector>

using namespace reprise;
using namespace std::chrono_literals;
using backend::MetadataParser;
using player::PlaybackController;
using test::FakeEngine;

namespace fs = std::filesystem;

namespace {

void create_dummy_file(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path);
    f << "dummy content";
}

fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

fs::path library(const std::string& name) {
    fs::path dir = fresh_dir(name);
    create_dummy_file(dir / "Book" / "01 Opening.mp3");
    create_dummy_file(dir / "Book" / "02 Middle.mp3");
    create_dummy_file(dir / "Book" / "03 Ending.mp3");
    create_dummy_file(dir / "Book" / "cover.jpg");
    return dir;
}

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

model::TrackMetadata name_only(const model::MediaRef& ref) {
    model::TrackMetadata meta;
    meta.title = ref.display_name();
    return meta;
}

} // namespace

TEST_CASE(test_resume_across_restart) {
    fs::path root = library("reprise_it_restart");
    fs::path db_path = root / "state" / "memories.db";
    fs::path snap_path = root / "state" / "last.snap";
    auto folder = model::FolderRef::path((root / "Book").string());
    std::string first = (root / "Book" / "01 Opening.mp3").string();

    FakeEngine* engine = nullptr;
    {
        PlaybackController controller(test::fake_engine_factory(engine),
                                      std::make_shared<backend::MemoryDatabase>(db_path),
                                      std::make_shared<backend::SnapshotFile>(snap_path));
        controller.set_metadata_reader(name_only);

        ASSERT_TRUE(controller.load_folder_and_play(folder));
        ASSERT_TRUE(engine != nullptr);
        ASSERT_EQ(engine->items().size(), 3u);
        ASSERT_EQ(engine->count_prefix("seek:"), 0);

        engine->emit(audio::IsPlayingChanged{true});
        controller.process_events();
        ASSERT_TRUE(controller.snapshot()->is_playing);

        engine->set_position(42000);
        controller.release();
        ASSERT_FALSE(controller.has_session());
    }

    // A new process: fresh stores read back from disk
    engine = nullptr;
    auto store = std::make_shared<backend::MemoryDatabase>(db_path);
    auto snapshots = std::make_shared<backend::SnapshotFile>(snap_path);
    ASSERT_EQ(store->get_memory(first)->position_ms, 42000);
    ASSERT_EQ(snapshots->last()->file_identity, first);

    PlaybackController controller(test::fake_engine_factory(engine), store, snapshots);
    controller.set_metadata_reader(name_only);

    auto last = controller.last_session();
    ASSERT_TRUE(last.has_value());
    ASSERT_EQ(last->file_identity, first);
    ASSERT_EQ(last->display_name, "01 Opening");

    ASSERT_TRUE(controller.load_folder_and_play(folder));
    int seek = engine->index_of("seek:-:42000");
    ASSERT_TRUE(seek >= 0);
    ASSERT_TRUE(engine->index_of("play") > seek);
    ASSERT_EQ(controller.snapshot()->position_ms, 42000);

    controller.release();
    fs::remove_all(root);
}

TEST_CASE(test_imported_playlist_is_marked_played) {
    fs::path root = library("reprise_it_import");
    auto folder = model::FolderRef::path((root / "Book").string());
    auto store = std::make_shared<backend::MemoryDatabase>();

    FakeEngine* engine = nullptr;
    PlaybackController controller(test::fake_engine_factory(engine), store,
                                  std::make_shared<backend::SnapshotFile>());
    controller.set_metadata_reader(name_only);

    auto record = controller.import_playlist(folder);
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->name, "Book");
    ASSERT_EQ(record->track_count, 3);
    ASSERT_EQ(record->last_played_at, 0);

    // Re-import keeps the id
    ASSERT_EQ(controller.import_playlist(folder, "Renamed")->id, record->id);
    ASSERT_EQ(controller.playlists().size(), 1u);
    ASSERT_EQ(controller.playlists()[0].name, "Renamed");

    ASSERT_TRUE(controller.load_folder_and_play(folder, 1));
    ASSERT_TRUE(controller.snapshot()->playlist->playlist_id.has_value());
    ASSERT_EQ(controller.snapshot()->current_index, 1);
    ASSERT_TRUE(wait_until([&] { return store->playlist_by_folder(folder.identity)->last_played_at > 0; }));

    controller.delete_playlist(record->id);
    ASSERT_TRUE(controller.playlists().empty());

    ASSERT_FALSE(controller.import_playlist(model::FolderRef::path((root / "missing").string())).has_value());

    controller.release();
    fs::remove_all(root);
}

TEST_CASE(test_controller_without_session) {
    FakeEngine* engine = nullptr;
    PlaybackController controller(test::fake_engine_factory(engine),
                                  std::make_shared<backend::MemoryDatabase>(),
                                  std::make_shared<backend::SnapshotFile>());

    std::vector<std::string> modes;
    controller.events().subscribe(events::Event::Type::PlayModeChanged,
                                  [&modes](const events::Event& e) { modes.push_back(e.data); });

    controller.play();
    controller.pause();
    controller.next();
    controller.seek_to(1000);
    ASSERT_FALSE(controller.has_session());
    ASSERT_FALSE(controller.save_memory_manually().has_value());
    ASSERT_FALSE(controller.add_bookmark().has_value());
    ASSERT_EQ(controller.process_events(), 0u);

    controller.toggle_mode();
    controller.toggle_mode();
    controller.toggle_mode();
    ASSERT_TRUE(controller.snapshot()->play_mode == model::PlayMode::Sequential);
    ASSERT_EQ(modes.size(), 3u);
    ASSERT_EQ(modes[0], "shuffle");
    ASSERT_EQ(modes[1], "repeat_one");
    ASSERT_EQ(modes[2], "sequential");
    ASSERT_TRUE(engine == nullptr);
}

TEST_CASE(test_mode_chosen_before_load_reaches_engine) {
    fs::path root = library("reprise_it_mode");
    FakeEngine* engine = nullptr;
    player::ControllerOptions options;
    options.audiobook_mode = true;
    PlaybackController controller(test::fake_engine_factory(engine),
                                  std::make_shared<backend::MemoryDatabase>(),
                                  std::make_shared<backend::SnapshotFile>(), nullptr, options);
    controller.set_metadata_reader(name_only);

    controller.set_play_mode(model::PlayMode::Shuffle);
    ASSERT_TRUE(controller.load_folder_and_play(model::FolderRef::path((root / "Book").string())));
    ASSERT_TRUE(engine->shuffle);
    ASSERT_TRUE(controller.snapshot()->audiobook_mode);

    controller.set_play_mode(model::PlayMode::RepeatOne);
    ASSERT_TRUE(engine->repeat_mode == audio::RepeatMode::One);

    controller.release();
    fs::remove_all(root);
}

TEST_CASE(test_bookmark_and_manual_save) {
    fs::path root = library("reprise_it_bookmark");
    FakeEngine* engine = nullptr;
    auto store = std::make_shared<backend::MemoryDatabase>();
    PlaybackController controller(test::fake_engine_factory(engine), store,
                                  std::make_shared<backend::SnapshotFile>());
    controller.set_metadata_reader(name_only);

    std::vector<model::MemorySaveEvent> saves;
    controller.events().subscribe(events::Event::Type::MemorySaved, [&saves](const events::Event& e) {
        if (e.memory) saves.push_back(*e.memory);
    });

    ASSERT_TRUE(controller.load_folder_and_play(model::FolderRef::path((root / "Book").string())));
    engine->set_position(65000);

    auto saved = controller.save_memory_manually();
    ASSERT_TRUE(saved.has_value());
    ASSERT_EQ(saved->display_name, "01 Opening");
    ASSERT_EQ(saves.size(), 1u);
    ASSERT_FALSE(saves[0].is_auto_save);

    auto id = controller.add_bookmark();
    ASSERT_TRUE(id.has_value());
    auto bookmarks = controller.resolver().bookmarks_for(saved->file_identity);
    ASSERT_EQ(bookmarks.size(), 1u);
    ASSERT_EQ(bookmarks[0].label, "Bookmark 01:05");
    ASSERT_EQ(bookmarks[0].position_ms, 65000);

    controller.release();
    fs::remove_all(root);
}

TEST_CASE(test_provider_playlist) {
    auto provider = std::make_shared<test::FakeProvider>();
    std::string root = test::FakeProvider::ROOT;
    provider->add_file(root, "b.ogg");
    provider->add_file(root, "a.mp3");

    FakeEngine* engine = nullptr;
    PlaybackController controller(test::fake_engine_factory(engine),
                                  std::make_shared<backend::MemoryDatabase>(),
                                  std::make_shared<backend::SnapshotFile>(), provider);
    controller.set_metadata_reader(name_only);

    ASSERT_TRUE(controller.load_folder_and_play(model::FolderRef::uri(root)));
    auto snap = controller.snapshot();
    ASSERT_TRUE(snap->playlist->mode() == model::RefKind::ProviderUri);
    ASSERT_EQ(snap->display_name, "a");
    ASSERT_EQ(*engine->items()[1].mime_type, "audio/ogg");

    // Loading again reuses the session
    FakeEngine* first_engine = engine;
    std::vector<backend::DocumentNode> nodes = {{root + "/b.ogg", "b.ogg", false}, {root + "/sub", "sub", true}};
    ASSERT_TRUE(controller.load_uris_and_play(nodes, root));
    ASSERT_TRUE(engine == first_engine);
    ASSERT_EQ(controller.snapshot()->playlist->size(), 1u);

    controller.release();
}

TEST_CASE(test_nothing_playable) {
    fs::path root = fresh_dir("reprise_it_empty");
    create_dummy_file(root / "notes.txt");

    FakeEngine* engine = nullptr;
    PlaybackController controller(test::fake_engine_factory(engine),
                                  std::make_shared<backend::MemoryDatabase>(),
                                  std::make_shared<backend::SnapshotFile>());
    ASSERT_FALSE(controller.load_folder_and_play(model::FolderRef::path(root.string())));
    ASSERT_FALSE(controller.load_files_and_play({}, root.string()));
    ASSERT_FALSE(controller.has_session());

    PlaybackController no_engine(nullptr, std::make_shared<backend::MemoryDatabase>(),
                                 std::make_shared<backend::SnapshotFile>());
    ASSERT_FALSE(no_engine.load_files_and_play({(root / "x.mp3").string()}, root.string()));

    fs::remove_all(root);
}

TEST_CASE(test_metadata_parser_nonexistent) {
    auto track = MetadataParser::parse_file("nonexistent.mp3");
    ASSERT_FALSE(track.is_valid);
    ASSERT_EQ(track.title, "nonexistent");
}

TEST_CASE(test_metadata_parser_garbage) {
    create_dummy_file("/tmp/reprise_test_track.mp3");
    auto track = MetadataParser::parse_file("/tmp/reprise_test_track.mp3");
    fs::remove("/tmp/reprise_test_track.mp3");

    ASSERT_EQ(track.title, "reprise test track");
    ASSERT_EQ(track.album, "tmp");
}

TEST_CASE(test_metadata_from_provider_name) {
    auto meta = MetadataParser::parse(model::MediaRef::from_uri("tree:/x/1", "01 - Artist - Title.mp3"));
    ASSERT_EQ(meta.title, "Title");
    ASSERT_EQ(meta.artist, "Artist");
}

int main() {
    return reprise::test::TestRunner::instance().run_all();
}
