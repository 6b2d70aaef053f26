#pragma once

#include "audio/MediaEngine.hpp"
#include "backend/Config.hpp"
#include "backend/DocumentProvider.hpp"
#include "backend/LibraryScanner.hpp"
#include "backend/MemoryResolver.hpp"
#include "backend/MemoryStore.hpp"
#include "backend/SnapshotStore.hpp"
#include "backend/StatePublisher.hpp"
#include "events/EventBus.hpp"
#include "player/Session.hpp"
#include "util/WorkerPool.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reprise::player {

struct ControllerOptions {
    collectors::TrackerConfig tracker_config;
    model::PlayMode play_mode = model::PlayMode::Sequential;
    bool audiobook_mode = false;
    size_t io_threads = 2;

    static ControllerOptions from_config(const backend::Config& config);
};

/**
 * PlaybackController: the public face of the engine.
 *
 * Owns the scanner, resolver, state publisher, event bus and I/O pool for
 * its whole life, and at most one Session. The session is created by the
 * first load and destroyed by release(); commands without a session are
 * logged no-ops, except play mode and audiobook mode, which are kept in
 * the state and applied to the next session.
 */
class PlaybackController {
public:
    PlaybackController(audio::EngineFactory engine_factory,
                       std::shared_ptr<backend::MemoryStore> store,
                       std::shared_ptr<backend::SnapshotStore> snapshots,
                       std::shared_ptr<backend::DocumentProvider> provider = nullptr,
                       ControllerOptions options = {});
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    // Observable state
    [[nodiscard]] std::shared_ptr<const model::Snapshot> snapshot() const;
    [[nodiscard]] events::EventBus& events() { return bus_; }

    void set_background_session(std::shared_ptr<BackgroundSession> background);
    void set_metadata_reader(MetadataReader reader);

    // Loading. Each returns false when there is nothing playable.
    bool load_folder_and_play(const model::FolderRef& folder, int start_index = 0);
    bool load_files_and_play(const std::vector<std::string>& paths, const std::string& folder_identity,
                             int start_index = 0);
    bool load_uris_and_play(const std::vector<backend::DocumentNode>& nodes, const std::string& folder_identity,
                            int start_index = 0);

    // Transport
    void play_at(int index);
    void play();
    void pause();
    void seek_to(int64_t position_ms);
    void next();
    void previous();
    void toggle_mode();
    void set_play_mode(model::PlayMode mode);
    void set_audiobook_mode(bool enabled);

    std::optional<model::SavedResult> save_memory_manually();
    // Bookmark at the current position; nullopt without a current item
    std::optional<int64_t> add_bookmark(const std::string& label = "");

    // Library
    [[nodiscard]] std::vector<model::MediaRef> scan(const model::FolderRef& folder) const;
    [[nodiscard]] model::ScanResult scan_diagnostic(const model::FolderRef& folder) const;
    [[nodiscard]] model::FolderListing list_folder(const model::FolderRef& folder) const;

    // Registers the folder as a playlist (one per folder); nullopt when it has no media
    std::optional<model::PlaylistRecord> import_playlist(const model::FolderRef& folder,
                                                         const std::string& name = "");
    [[nodiscard]] std::vector<model::PlaylistRecord> playlists() const;
    void delete_playlist(int64_t id);

    // Newest of the durable store's latest memory and the fast snapshot
    [[nodiscard]] std::optional<model::PlaybackMemory> last_session() const;

    [[nodiscard]] backend::MemoryResolver& resolver() { return resolver_; }

    // Runs queued engine events and background results on the calling thread
    size_t process_events();

    void release();
    [[nodiscard]] bool has_session() const;

private:
    bool load_playlist(model::Playlist playlist, int start_index);
    Session* active_session() const;

    audio::EngineFactory engine_factory_;
    std::shared_ptr<backend::MemoryStore> store_;
    std::shared_ptr<backend::SnapshotStore> snapshots_;
    ControllerOptions options_;

    events::EventBus bus_;
    std::shared_ptr<backend::StatePublisher> publisher_;
    backend::MemoryResolver resolver_;
    backend::LibraryScanner scanner_;
    std::shared_ptr<BackgroundSession> background_;
    MetadataReader metadata_reader_;

    // Declared after everything its jobs touch, so it drains first
    util::WorkerPool io_pool_;

    std::unique_ptr<Session> session_;
    mutable std::mutex session_mutex_;
};

}  // namespace reprise::player
