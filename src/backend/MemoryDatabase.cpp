#include "backend/MemoryDatabase.hpp"
#include "util/BinaryIO.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>

namespace reprise::backend {

using util::Logger;

// Binary format version magic
constexpr uint32_t DB_MAGIC = 0x52505253;  // 'RPRS'
constexpr uint32_t DB_VERSION = 1;

namespace {

void write_memory(std::ostream& out, const model::PlaybackMemory& m) {
    util::write_string(out, m.file_identity);
    util::write_pod(out, m.position_ms);
    util::write_pod(out, m.duration_ms);
    util::write_string(out, m.folder_identity);
    util::write_string(out, m.display_name);
    util::write_pod(out, m.saved_at);
}

bool read_memory(std::istream& in, model::PlaybackMemory& m) {
    return util::read_string(in, m.file_identity) &&
           util::read_pod(in, m.position_ms) &&
           util::read_pod(in, m.duration_ms) &&
           util::read_string(in, m.folder_identity) &&
           util::read_string(in, m.display_name) &&
           util::read_pod(in, m.saved_at);
}

void write_bookmark(std::ostream& out, const model::Bookmark& b) {
    util::write_pod(out, b.id);
    util::write_string(out, b.file_identity);
    util::write_pod(out, b.position_ms);
    util::write_pod(out, b.duration_ms);
    util::write_string(out, b.label);
    util::write_pod(out, b.created_at);
    util::write_string(out, b.folder_identity);
    util::write_string(out, b.display_name);
}

bool read_bookmark(std::istream& in, model::Bookmark& b) {
    return util::read_pod(in, b.id) &&
           util::read_string(in, b.file_identity) &&
           util::read_pod(in, b.position_ms) &&
           util::read_pod(in, b.duration_ms) &&
           util::read_string(in, b.label) &&
           util::read_pod(in, b.created_at) &&
           util::read_string(in, b.folder_identity) &&
           util::read_string(in, b.display_name);
}

void write_playlist(std::ostream& out, const model::PlaylistRecord& p) {
    util::write_pod(out, p.id);
    util::write_string(out, p.folder_identity);
    util::write_string(out, p.name);
    int32_t track_count = p.track_count;
    util::write_pod(out, track_count);
    util::write_pod(out, p.imported_at);
    util::write_pod(out, p.last_played_at);
}

bool read_playlist(std::istream& in, model::PlaylistRecord& p) {
    int32_t track_count = 0;
    bool ok = util::read_pod(in, p.id) &&
              util::read_string(in, p.folder_identity) &&
              util::read_string(in, p.name) &&
              util::read_pod(in, track_count) &&
              util::read_pod(in, p.imported_at) &&
              util::read_pod(in, p.last_played_at);
    p.track_count = track_count;
    return ok;
}

// Newest first; identity keeps equal timestamps in a stable order
bool saved_later(const model::PlaybackMemory& a, const model::PlaybackMemory& b) {
    if (a.saved_at != b.saved_at) return a.saved_at > b.saved_at;
    return a.file_identity < b.file_identity;
}

} // namespace

MemoryDatabase::MemoryDatabase() {
    Logger::debug("MemoryDatabase: In-memory database");
}

MemoryDatabase::MemoryDatabase(std::filesystem::path path)
    : path_(std::move(path)) {
    Logger::info("MemoryDatabase: Opening " + path_.string());
    load();
}

// ---- Memories ----

void MemoryDatabase::upsert_memory(const model::PlaybackMemory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = memories_.find(memory.file_identity);
    if (it != memories_.end() && it->second.memory.saved_at > memory.saved_at) {
        Logger::debug("MemoryDatabase: Ignoring older memory for " + memory.file_identity);
        return;
    }
    memories_[memory.file_identity] = {memory, util::normalize_display_name(memory.display_name)};
    save_locked();
}

std::optional<model::PlaybackMemory> MemoryDatabase::get_memory(const std::string& file_identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = memories_.find(file_identity);
    if (it == memories_.end()) return std::nullopt;
    return it->second.memory;
}

std::optional<model::PlaybackMemory> MemoryDatabase::get_memory_by_display_name(const std::string& display_name) {
    std::string wanted = util::normalize_display_name(display_name);
    if (wanted.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    const model::PlaybackMemory* best = nullptr;
    for (const auto& [identity, stored] : memories_) {
        if (stored.normalized_name != wanted) continue;
        if (!best || saved_later(stored.memory, *best)) {
            best = &stored.memory;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<model::PlaybackMemory> MemoryDatabase::latest_memory() {
    std::lock_guard<std::mutex> lock(mutex_);
    const model::PlaybackMemory* best = nullptr;
    for (const auto& [identity, stored] : memories_) {
        if (!best || saved_later(stored.memory, *best)) {
            best = &stored.memory;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::vector<model::PlaybackMemory> MemoryDatabase::all_memories() {
    std::vector<model::PlaybackMemory> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(memories_.size());
        for (const auto& [identity, stored] : memories_) {
            result.push_back(stored.memory);
        }
    }
    std::sort(result.begin(), result.end(), saved_later);
    return result;
}

std::vector<model::PlaybackMemory> MemoryDatabase::memories_in_folder(const std::string& folder_identity) {
    std::vector<model::PlaybackMemory> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [identity, stored] : memories_) {
            if (stored.memory.folder_identity == folder_identity) {
                result.push_back(stored.memory);
            }
        }
    }
    std::sort(result.begin(), result.end(), saved_later);
    return result;
}

void MemoryDatabase::delete_memory(const std::string& file_identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memories_.erase(file_identity) > 0) {
        save_locked();
    }
}

void MemoryDatabase::delete_all_memories() {
    std::lock_guard<std::mutex> lock(mutex_);
    memories_.clear();
    save_locked();
}

// ---- Bookmarks ----

int64_t MemoryDatabase::insert_bookmark(const model::Bookmark& bookmark) {
    std::lock_guard<std::mutex> lock(mutex_);
    model::Bookmark stored = bookmark;
    stored.id = next_bookmark_id_++;
    bookmarks_[stored.id] = stored;
    save_locked();
    return stored.id;
}

std::optional<model::Bookmark> MemoryDatabase::get_bookmark(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bookmarks_.find(id);
    if (it == bookmarks_.end()) return std::nullopt;
    return it->second;
}

std::vector<model::Bookmark> MemoryDatabase::bookmarks_for(const std::string& file_identity) {
    std::vector<model::Bookmark> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, b] : bookmarks_) {
            if (b.file_identity == file_identity) result.push_back(b);
        }
    }
    std::sort(result.begin(), result.end(), [](const model::Bookmark& a, const model::Bookmark& b) {
        if (a.position_ms != b.position_ms) return a.position_ms < b.position_ms;
        return a.id < b.id;
    });
    return result;
}

std::vector<model::Bookmark> MemoryDatabase::all_bookmarks() {
    std::vector<model::Bookmark> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(bookmarks_.size());
        for (const auto& [id, b] : bookmarks_) result.push_back(b);
    }
    std::sort(result.begin(), result.end(), [](const model::Bookmark& a, const model::Bookmark& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });
    return result;
}

void MemoryDatabase::update_bookmark_label(int64_t id, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bookmarks_.find(id);
    if (it == bookmarks_.end()) return;
    it->second.label = label;
    save_locked();
}

void MemoryDatabase::delete_bookmark(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bookmarks_.erase(id) > 0) {
        save_locked();
    }
}

// ---- Playlists ----

int64_t MemoryDatabase::upsert_playlist(const model::PlaylistRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& [id, existing] : playlists_) {
        if (existing.folder_identity == record.folder_identity) {
            existing.name = record.name;
            existing.track_count = record.track_count;
            if (record.imported_at != 0) existing.imported_at = record.imported_at;
            if (record.last_played_at != 0) existing.last_played_at = record.last_played_at;
            save_locked();
            return id;
        }
    }

    model::PlaylistRecord stored = record;
    stored.id = next_playlist_id_++;
    playlists_[stored.id] = stored;
    save_locked();
    return stored.id;
}

std::optional<model::PlaylistRecord> MemoryDatabase::playlist_by_folder(const std::string& folder_identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, p] : playlists_) {
        if (p.folder_identity == folder_identity) return p;
    }
    return std::nullopt;
}

std::vector<model::PlaylistRecord> MemoryDatabase::playlists_by_last_played() {
    std::vector<model::PlaylistRecord> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(playlists_.size());
        for (const auto& [id, p] : playlists_) result.push_back(p);
    }
    std::sort(result.begin(), result.end(), [](const model::PlaylistRecord& a, const model::PlaylistRecord& b) {
        if (a.last_played_at != b.last_played_at) return a.last_played_at > b.last_played_at;
        if (a.imported_at != b.imported_at) return a.imported_at > b.imported_at;
        return a.id < b.id;
    });
    return result;
}

void MemoryDatabase::update_playlist_track_count(int64_t id, int track_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = playlists_.find(id);
    if (it == playlists_.end()) return;
    it->second.track_count = track_count;
    save_locked();
}

void MemoryDatabase::update_playlist_last_played(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = playlists_.find(id);
    if (it == playlists_.end()) return;
    it->second.last_played_at = util::Platform::now_epoch_ms();
    save_locked();
}

void MemoryDatabase::delete_playlist(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (playlists_.erase(id) > 0) {
        save_locked();
    }
}

// ---- Persistence ----

void MemoryDatabase::save_locked() const {
    if (path_.empty()) return;

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            Logger::error("MemoryDatabase: Cannot create " + path_.parent_path().string() + ": " + ec.message());
            return;
        }
    }

    std::filesystem::path tmp_path = path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            Logger::error("MemoryDatabase: Cannot write " + tmp_path.string());
            return;
        }

        // Header
        util::write_pod(out, DB_MAGIC);
        util::write_pod(out, DB_VERSION);
        util::write_pod(out, next_bookmark_id_);
        util::write_pod(out, next_playlist_id_);

        uint64_t count = memories_.size();
        util::write_pod(out, count);
        for (const auto& [identity, stored] : memories_) {
            write_memory(out, stored.memory);
        }

        count = bookmarks_.size();
        util::write_pod(out, count);
        for (const auto& [id, b] : bookmarks_) {
            write_bookmark(out, b);
        }

        count = playlists_.size();
        util::write_pod(out, count);
        for (const auto& [id, p] : playlists_) {
            write_playlist(out, p);
        }

        out.flush();
        if (!out) {
            Logger::error("MemoryDatabase: Write failed for " + tmp_path.string());
            return;
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        Logger::error("MemoryDatabase: Rename to " + path_.string() + " failed: " + ec.message());
        std::filesystem::remove(tmp_path, ec);
        return;
    }
}

void MemoryDatabase::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        Logger::info("MemoryDatabase: No database yet at " + path_.string());
        return;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        Logger::error("MemoryDatabase: Cannot open " + path_.string());
        return;
    }

    uint32_t magic = 0, version = 0;
    if (!util::read_pod(in, magic) || magic != DB_MAGIC) {
        Logger::error("MemoryDatabase: Bad magic in " + path_.string() + ", starting empty");
        return;
    }
    if (!util::read_pod(in, version) || version != DB_VERSION) {
        Logger::error("MemoryDatabase: Unsupported database version: " + std::to_string(version));
        return;
    }

    int64_t next_bookmark_id = 1, next_playlist_id = 1;
    if (!util::read_pod(in, next_bookmark_id) || !util::read_pod(in, next_playlist_id)) {
        Logger::error("MemoryDatabase: Truncated header in " + path_.string());
        return;
    }

    std::unordered_map<std::string, StoredMemory> memories;
    std::map<int64_t, model::Bookmark> bookmarks;
    std::map<int64_t, model::PlaylistRecord> playlists;

    uint64_t count = 0;
    bool ok = util::read_pod(in, count);
    for (uint64_t i = 0; ok && i < count; ++i) {
        model::PlaybackMemory m;
        ok = read_memory(in, m);
        if (ok) {
            std::string normalized = util::normalize_display_name(m.display_name);
            memories[m.file_identity] = {std::move(m), std::move(normalized)};
        }
    }

    ok = ok && util::read_pod(in, count);
    for (uint64_t i = 0; ok && i < count; ++i) {
        model::Bookmark b;
        ok = read_bookmark(in, b);
        if (ok) bookmarks[b.id] = std::move(b);
    }

    ok = ok && util::read_pod(in, count);
    for (uint64_t i = 0; ok && i < count; ++i) {
        model::PlaylistRecord p;
        ok = read_playlist(in, p);
        if (ok) playlists[p.id] = std::move(p);
    }

    if (!ok) {
        Logger::error("MemoryDatabase: Truncated database " + path_.string() + ", starting empty");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    memories_ = std::move(memories);
    bookmarks_ = std::move(bookmarks);
    playlists_ = std::move(playlists);
    next_bookmark_id_ = next_bookmark_id;
    next_playlist_id_ = next_playlist_id;

    Logger::info("MemoryDatabase: Loaded " + std::to_string(memories_.size()) + " memories, " +
                 std::to_string(bookmarks_.size()) + " bookmarks, " +
                 std::to_string(playlists_.size()) + " playlists");
}

}  // namespace reprise::backend
