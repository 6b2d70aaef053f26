#include "backend/SnapshotFile.hpp"
#include "util/BinaryIO.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <openssl/sha.h>
#include <cstring>
#include <fstream>
#include <sstream>

namespace reprise::backend {

using util::Logger;

constexpr uint32_t SNAPSHOT_MAGIC = 0x52505346;  // 'RPSF'
constexpr uint32_t SNAPSHOT_VERSION = 1;

SnapshotFile::SnapshotFile() = default;

SnapshotFile::SnapshotFile(std::filesystem::path path)
    : path_(std::move(path)) {
    load();
}

void SnapshotFile::put(const std::string& file_identity, int64_t position_ms, int64_t duration_ms,
                       const std::string& folder_identity, const std::string& display_name) {
    model::PlaybackMemory record;
    record.file_identity = file_identity;
    record.position_ms = position_ms;
    record.duration_ms = duration_ms;
    record.folder_identity = folder_identity;
    record.display_name = display_name;
    record.saved_at = util::Platform::now_epoch_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    last_ = record;
    write_locked(record);
}

std::optional<model::PlaybackMemory> SnapshotFile::last() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

void SnapshotFile::erase(const std::string& file_identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_ || last_->file_identity != file_identity) return;
    clear_locked();
}

void SnapshotFile::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_locked();
}

void SnapshotFile::clear_locked() {
    last_.reset();
    if (path_.empty()) return;

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        Logger::error("SnapshotFile: Cannot remove " + path_.string() + ": " + ec.message());
        return;
    }
    Logger::debug("SnapshotFile: Cleared " + path_.string());
}

void SnapshotFile::write_locked(const model::PlaybackMemory& record) const {
    if (path_.empty()) return;

    std::ostringstream payload_stream;
    util::write_string(payload_stream, record.file_identity);
    util::write_pod(payload_stream, record.position_ms);
    util::write_pod(payload_stream, record.duration_ms);
    util::write_string(payload_stream, record.folder_identity);
    util::write_string(payload_stream, record.display_name);
    util::write_pod(payload_stream, record.saved_at);
    std::string payload = payload_stream.str();

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(payload.data()), payload.size(), digest);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        Logger::error("SnapshotFile: Cannot write " + path_.string());
        return;
    }

    util::write_pod(out, SNAPSHOT_MAGIC);
    util::write_pod(out, SNAPSHOT_VERSION);
    util::write_string(out, payload);
    out.write(reinterpret_cast<const char*>(digest), SHA256_DIGEST_LENGTH);
    out.flush();
    if (!out) {
        Logger::error("SnapshotFile: Write failed for " + path_.string());
    }
}

void SnapshotFile::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        Logger::debug("SnapshotFile: No snapshot at " + path_.string());
        return;
    }

    std::ifstream in(path_, std::ios::binary);
    uint32_t magic = 0, version = 0;
    std::string payload;
    unsigned char stored_digest[SHA256_DIGEST_LENGTH];

    if (!in || !util::read_pod(in, magic) || magic != SNAPSHOT_MAGIC ||
        !util::read_pod(in, version) || version != SNAPSHOT_VERSION ||
        !util::read_string(in, payload) ||
        !in.read(reinterpret_cast<char*>(stored_digest), SHA256_DIGEST_LENGTH)) {
        Logger::warn("SnapshotFile: Ignoring unreadable snapshot " + path_.string());
        return;
    }

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(payload.data()), payload.size(), digest);
    if (std::memcmp(digest, stored_digest, SHA256_DIGEST_LENGTH) != 0) {
        Logger::warn("SnapshotFile: Digest mismatch, ignoring torn snapshot " + path_.string());
        return;
    }

    std::istringstream payload_stream(payload);
    model::PlaybackMemory record;
    if (!util::read_string(payload_stream, record.file_identity) ||
        !util::read_pod(payload_stream, record.position_ms) ||
        !util::read_pod(payload_stream, record.duration_ms) ||
        !util::read_string(payload_stream, record.folder_identity) ||
        !util::read_string(payload_stream, record.display_name) ||
        !util::read_pod(payload_stream, record.saved_at)) {
        Logger::warn("SnapshotFile: Malformed snapshot payload in " + path_.string());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_ = std::move(record);
    Logger::info("SnapshotFile: Restored last position for " + last_->file_identity);
}

}  // namespace reprise::backend
