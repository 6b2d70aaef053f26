#include "../framework/SimpleTest.hpp"
#include "backend/MemoryDatabase.hpp"
#include "backend/SnapshotFile.hpp"
#include <filesystem>
#include <fstream>

using namespace reprise::backend;
using namespace reprise::model;

namespace fs = std::filesystem;

namespace {

PlaybackMemory memory(const std::string& id, int64_t pos, int64_t saved_at,
                      const std::string& name = "", const std::string& folder = "/m") {
    PlaybackMemory m;
    m.file_identity = id;
    m.position_ms = pos;
    m.duration_ms = 600000;
    m.folder_identity = folder;
    m.display_name = name;
    m.saved_at = saved_at;
    return m;
}

fs::path temp_file(const std::string& name) {
    fs::path path = fs::temp_directory_path() / name;
    fs::remove(path);
    return path;
}

} // namespace

TEST_CASE(test_one_memory_per_identity) {
    MemoryDatabase db;
    db.upsert_memory(memory("/m/a.mp3", 1000, 1));
    db.upsert_memory(memory("/m/a.mp3", 5000, 2));

    ASSERT_EQ(db.all_memories().size(), 1u);
    ASSERT_EQ(db.get_memory("/m/a.mp3")->position_ms, 5000);
    ASSERT_FALSE(db.get_memory("/m/b.mp3").has_value());
    ASSERT_FALSE(db.is_persistent());
}

TEST_CASE(test_older_upsert_does_not_replace_newer) {
    MemoryDatabase db;
    db.upsert_memory(memory("/m/a.mp3", 12000, 20));
    db.upsert_memory(memory("/m/a.mp3", 10000, 10));

    ASSERT_EQ(db.get_memory("/m/a.mp3")->position_ms, 12000);
    ASSERT_EQ(db.get_memory("/m/a.mp3")->saved_at, 20);

    // Same timestamp still replaces
    db.upsert_memory(memory("/m/a.mp3", 12500, 20));
    ASSERT_EQ(db.get_memory("/m/a.mp3")->position_ms, 12500);
}

TEST_CASE(test_memories_newest_first) {
    MemoryDatabase db;
    db.upsert_memory(memory("/m/a.mp3", 1, 100));
    db.upsert_memory(memory("/m/b.mp3", 1, 300));
    db.upsert_memory(memory("/other/c.mp3", 1, 200, "", "/other"));

    auto all = db.all_memories();
    ASSERT_EQ(all[0].file_identity, "/m/b.mp3");
    ASSERT_EQ(all[1].file_identity, "/other/c.mp3");
    ASSERT_EQ(all[2].file_identity, "/m/a.mp3");
    ASSERT_EQ(db.latest_memory()->file_identity, "/m/b.mp3");

    auto in_folder = db.memories_in_folder("/m");
    ASSERT_EQ(in_folder.size(), 2u);
    ASSERT_EQ(in_folder[0].file_identity, "/m/b.mp3");
}

TEST_CASE(test_display_name_lookup_is_normalized) {
    MemoryDatabase db;
    db.upsert_memory(memory("/m/bjork.mp3", 1000, 1, "Björk - Jóga"));
    db.upsert_memory(memory("tree:/x/bjork.mp3", 2000, 5, "bjork - joga"));

    auto found = db.get_memory_by_display_name("  BJORK - JOGA ");
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->file_identity, "tree:/x/bjork.mp3");
    ASSERT_FALSE(db.get_memory_by_display_name("").has_value());
}

TEST_CASE(test_delete_memories) {
    MemoryDatabase db;
    db.upsert_memory(memory("/m/a.mp3", 1, 1));
    db.upsert_memory(memory("/m/b.mp3", 1, 2));

    db.delete_memory("/m/a.mp3");
    db.delete_memory("/m/missing.mp3");
    ASSERT_EQ(db.all_memories().size(), 1u);

    db.delete_all_memories();
    ASSERT_TRUE(db.all_memories().empty());
    ASSERT_FALSE(db.latest_memory().has_value());
}

TEST_CASE(test_bookmark_ordering) {
    MemoryDatabase db;
    Bookmark b;
    b.file_identity = "/m/a.mp3";

    b.position_ms = 9000;
    b.created_at = 1;
    int64_t first = db.insert_bookmark(b);
    b.position_ms = 3000;
    b.created_at = 2;
    int64_t second = db.insert_bookmark(b);
    b.file_identity = "/m/b.mp3";
    b.created_at = 3;
    int64_t third = db.insert_bookmark(b);

    ASSERT_TRUE(first != second);
    auto for_a = db.bookmarks_for("/m/a.mp3");
    ASSERT_EQ(for_a.size(), 2u);
    ASSERT_EQ(for_a[0].id, second);
    ASSERT_EQ(for_a[1].id, first);

    auto all = db.all_bookmarks();
    ASSERT_EQ(all.size(), 3u);
    ASSERT_EQ(all[0].id, third);

    db.update_bookmark_label(first, "Chapter 2");
    ASSERT_EQ(db.get_bookmark(first)->label, "Chapter 2");

    db.delete_bookmark(first);
    ASSERT_FALSE(db.get_bookmark(first).has_value());
}

TEST_CASE(test_playlist_upsert_keeps_id) {
    MemoryDatabase db;
    PlaylistRecord record;
    record.folder_identity = "/m/book";
    record.name = "Book";
    record.track_count = 3;
    record.imported_at = 10;

    int64_t id = db.upsert_playlist(record);
    record.name = "Book (renamed)";
    record.track_count = 4;
    ASSERT_EQ(db.upsert_playlist(record), id);

    auto stored = db.playlist_by_folder("/m/book");
    ASSERT_EQ(stored->name, "Book (renamed)");
    ASSERT_EQ(stored->track_count, 4);

    db.update_playlist_track_count(id, 9);
    ASSERT_EQ(db.playlist_by_folder("/m/book")->track_count, 9);
}

TEST_CASE(test_playlists_by_last_played) {
    MemoryDatabase db;
    PlaylistRecord a;
    a.folder_identity = "/m/a";
    a.imported_at = 100;
    PlaylistRecord b;
    b.folder_identity = "/m/b";
    b.imported_at = 200;

    int64_t id_a = db.upsert_playlist(a);
    int64_t id_b = db.upsert_playlist(b);

    // Never played: newest import first
    ASSERT_EQ(db.playlists_by_last_played()[0].id, id_b);

    db.update_playlist_last_played(id_a);
    auto ordered = db.playlists_by_last_played();
    ASSERT_EQ(ordered[0].id, id_a);
    ASSERT_TRUE(ordered[0].last_played_at > 0);

    db.delete_playlist(id_a);
    ASSERT_EQ(db.playlists_by_last_played().size(), 1u);
}

TEST_CASE(test_database_survives_reopen) {
    fs::path path = temp_file("reprise_test_memories.db");
    int64_t bookmark_id = 0;
    {
        MemoryDatabase db(path);
        ASSERT_TRUE(db.is_persistent());
        db.upsert_memory(memory("/m/a.mp3", 42000, 7, "a"));
        Bookmark b;
        b.file_identity = "/m/a.mp3";
        b.label = "intro";
        bookmark_id = db.insert_bookmark(b);
        PlaylistRecord p;
        p.folder_identity = "/m";
        p.name = "m";
        ASSERT_EQ(db.upsert_playlist(p), 1);
    }

    MemoryDatabase reopened(path);
    ASSERT_EQ(reopened.get_memory("/m/a.mp3")->position_ms, 42000);
    ASSERT_EQ(reopened.get_memory_by_display_name("A")->file_identity, "/m/a.mp3");
    ASSERT_EQ(reopened.get_bookmark(bookmark_id)->label, "intro");
    ASSERT_EQ(reopened.playlist_by_folder("/m")->id, 1);

    // Ids keep counting after a reopen
    Bookmark next;
    next.file_identity = "/m/a.mp3";
    ASSERT_TRUE(reopened.insert_bookmark(next) > bookmark_id);

    fs::remove(path);
}

TEST_CASE(test_database_ignores_foreign_file) {
    fs::path path = temp_file("reprise_test_garbage.db");
    {
        std::ofstream out(path, std::ios::binary);
        out << "definitely not a database";
    }

    MemoryDatabase db(path);
    ASSERT_TRUE(db.all_memories().empty());

    db.upsert_memory(memory("/m/a.mp3", 1, 1));
    MemoryDatabase reopened(path);
    ASSERT_EQ(reopened.all_memories().size(), 1u);

    fs::remove(path);
}

TEST_CASE(test_snapshot_file_survives_reopen) {
    fs::path path = temp_file("reprise_test_last.snap");
    {
        SnapshotFile snapshots(path);
        ASSERT_FALSE(snapshots.last().has_value());
        snapshots.put("/m/a.mp3", 1000, 9000, "/m", "a");
        snapshots.put("/m/b.mp3", 2500, 9000, "/m", "b");
        ASSERT_EQ(snapshots.last()->file_identity, "/m/b.mp3");
    }

    SnapshotFile reopened(path);
    auto last = reopened.last();
    ASSERT_TRUE(last.has_value());
    ASSERT_EQ(last->file_identity, "/m/b.mp3");
    ASSERT_EQ(last->position_ms, 2500);
    ASSERT_TRUE(last->saved_at > 0);

    fs::remove(path);
}

TEST_CASE(test_snapshot_file_erase_and_clear) {
    fs::path path = temp_file("reprise_test_erase.snap");
    {
        SnapshotFile snapshots(path);
        snapshots.put("/m/a.mp3", 1000, 9000, "/m", "a");

        snapshots.erase("/m/other.mp3");
        ASSERT_TRUE(snapshots.last().has_value());
        ASSERT_TRUE(fs::exists(path));

        snapshots.erase("/m/a.mp3");
        ASSERT_FALSE(snapshots.last().has_value());
        ASSERT_FALSE(fs::exists(path));

        snapshots.put("/m/b.mp3", 2000, 9000, "/m", "b");
        snapshots.clear();
        ASSERT_FALSE(snapshots.last().has_value());
        snapshots.clear();
    }

    SnapshotFile reopened(path);
    ASSERT_FALSE(reopened.last().has_value());

    fs::remove(path);
}

TEST_CASE(test_snapshot_file_rejects_torn_write) {
    fs::path path = temp_file("reprise_test_torn.snap");
    {
        SnapshotFile snapshots(path);
        snapshots.put("/m/a.mp3", 1000, 9000, "/m", "a");
    }

    // Flip one payload byte so the digest no longer matches
    {
        std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(14);
        f.put('#');
    }

    SnapshotFile reopened(path);
    ASSERT_FALSE(reopened.last().has_value());

    fs::resize_file(path, 10);
    SnapshotFile truncated(path);
    ASSERT_FALSE(truncated.last().has_value());

    fs::remove(path);
}

int main() {
    return reprise::test::TestRunner::instance().run_all();
}
