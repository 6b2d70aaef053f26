#include "player/PlaybackController.hpp"
#include "backend/MetadataParser.hpp"
#include "backend/PlaylistBuilder.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"

namespace reprise::player {

using util::Logger;

ControllerOptions ControllerOptions::from_config(const backend::Config& config) {
    ControllerOptions options;
    options.tracker_config.tick_interval = std::chrono::milliseconds(config.tick_interval_ms);
    options.tracker_config.durable_save_every_ticks = config.durable_save_every_ticks;
    options.tracker_config.audiobook_save_interval_ms = config.audiobook_save_interval_ms;
    options.play_mode = config.play_mode;
    options.audiobook_mode = config.audiobook_mode;
    return options;
}

PlaybackController::PlaybackController(audio::EngineFactory engine_factory,
                                       std::shared_ptr<backend::MemoryStore> store,
                                       std::shared_ptr<backend::SnapshotStore> snapshots,
                                       std::shared_ptr<backend::DocumentProvider> provider,
                                       ControllerOptions options)
    : engine_factory_(std::move(engine_factory)),
      store_(std::move(store)),
      snapshots_(std::move(snapshots)),
      options_(options),
      publisher_(std::make_shared<backend::StatePublisher>()),
      resolver_(store_, snapshots_, &bus_),
      scanner_(std::move(provider)),
      metadata_reader_(&backend::MetadataParser::parse),
      io_pool_(options.io_threads, "io") {
    publisher_->update([&](model::Snapshot& s) {
        s.play_mode = options_.play_mode;
        s.audiobook_mode = options_.audiobook_mode;
    });
    Logger::info("PlaybackController: Ready (play mode " + std::string(model::to_string(options_.play_mode)) +
                 (options_.audiobook_mode ? ", audiobook" : "") + ")");
}

PlaybackController::~PlaybackController() {
    release();
}

std::shared_ptr<const model::Snapshot> PlaybackController::snapshot() const {
    return publisher_->get_current();
}

void PlaybackController::set_background_session(std::shared_ptr<BackgroundSession> background) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    background_ = std::move(background);
}

void PlaybackController::set_metadata_reader(MetadataReader reader) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    metadata_reader_ = std::move(reader);
}

Session* PlaybackController::active_session() const {
    if (!session_ || session_->is_released()) {
        Logger::debug("PlaybackController: No active session");
        return nullptr;
    }
    return session_.get();
}

// ---- Loading ----

bool PlaybackController::load_folder_and_play(const model::FolderRef& folder, int start_index) {
    auto refs = scanner_.scan(folder);
    if (refs.empty()) {
        Logger::warn("PlaybackController: Nothing playable in " + folder.identity);
        return false;
    }

    std::optional<int64_t> playlist_id;
    if (auto record = store_->playlist_by_folder(folder.identity)) {
        playlist_id = record->id;
        if (record->track_count != static_cast<int>(refs.size())) {
            store_->update_playlist_track_count(record->id, static_cast<int>(refs.size()));
        }
    }

    return load_playlist(backend::PlaylistBuilder::build(refs, folder.identity, playlist_id), start_index);
}

bool PlaybackController::load_files_and_play(const std::vector<std::string>& paths,
                                             const std::string& folder_identity, int start_index) {
    std::vector<model::MediaRef> refs;
    refs.reserve(paths.size());
    for (const auto& path : paths) {
        refs.push_back(model::MediaRef::from_path(path));
    }
    return load_playlist(backend::PlaylistBuilder::build(refs, folder_identity), start_index);
}

bool PlaybackController::load_uris_and_play(const std::vector<backend::DocumentNode>& nodes,
                                            const std::string& folder_identity, int start_index) {
    std::vector<model::MediaRef> refs;
    refs.reserve(nodes.size());
    for (const auto& node : nodes) {
        if (node.is_directory) continue;
        refs.push_back(model::MediaRef::from_uri(node.uri, node.name));
    }
    return load_playlist(backend::PlaylistBuilder::build(refs, folder_identity), start_index);
}

bool PlaybackController::load_playlist(model::Playlist playlist, int start_index) {
    if (playlist.empty()) {
        Logger::warn("PlaybackController: Empty playlist for " + playlist.folder_identity);
        return false;
    }

    std::lock_guard<std::mutex> lock(session_mutex_);

    if (!session_ || session_->is_released()) {
        auto engine = engine_factory_ ? engine_factory_() : nullptr;
        if (!engine) {
            Logger::error("PlaybackController: Engine factory returned no engine");
            return false;
        }

        SessionContext ctx;
        ctx.publisher = publisher_;
        ctx.resolver = &resolver_;
        ctx.store = store_.get();
        ctx.bus = &bus_;
        ctx.io_pool = &io_pool_;
        ctx.background = background_.get();
        ctx.metadata_reader = metadata_reader_;
        ctx.tracker_config = options_.tracker_config;
        session_ = std::make_unique<Session>(std::move(engine), std::move(ctx));
    }

    session_->load(std::make_shared<const model::Playlist>(std::move(playlist)), start_index);
    return true;
}

// ---- Transport ----

void PlaybackController::play_at(int index) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (auto* session = active_session()) session->play_at(index);
}

void PlaybackController::play() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (auto* session = active_session()) session->play();
}

void PlaybackController::pause() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (auto* session = active_session()) session->pause();
}

void PlaybackController::seek_to(int64_t position_ms) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (auto* session = active_session()) session->seek_to(position_ms);
}

void PlaybackController::next() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (auto* session = active_session()) session->next();
}

void PlaybackController::previous() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (auto* session = active_session()) session->previous();
}

void PlaybackController::toggle_mode() {
    set_play_mode(model::next_play_mode(publisher_->get_current()->play_mode));
}

void PlaybackController::set_play_mode(model::PlayMode mode) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    options_.play_mode = mode;
    if (session_ && !session_->is_released()) {
        session_->set_play_mode(mode);
        return;
    }
    publisher_->update([mode](model::Snapshot& s) { s.play_mode = mode; });
    bus_.publish({events::Event::Type::PlayModeChanged, -1, model::to_string(mode), std::nullopt});
}

void PlaybackController::set_audiobook_mode(bool enabled) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    options_.audiobook_mode = enabled;
    if (session_ && !session_->is_released()) {
        session_->set_audiobook_mode(enabled);
        return;
    }
    publisher_->update([enabled](model::Snapshot& s) { s.audiobook_mode = enabled; });
}

std::optional<model::SavedResult> PlaybackController::save_memory_manually() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (auto* session = active_session()) return session->save_memory_manually();
    return std::nullopt;
}

std::optional<int64_t> PlaybackController::add_bookmark(const std::string& label) {
    auto snap = publisher_->get_current();
    if (!snap->current_ref) {
        Logger::debug("PlaybackController: Bookmark without a current item");
        return std::nullopt;
    }
    return resolver_.add_bookmark(*snap->current_ref, snap->position_ms, snap->duration_ms, label,
                                  snap->folder_identity, snap->display_name);
}

// ---- Library ----

std::vector<model::MediaRef> PlaybackController::scan(const model::FolderRef& folder) const {
    return scanner_.scan(folder);
}

model::ScanResult PlaybackController::scan_diagnostic(const model::FolderRef& folder) const {
    return scanner_.scan_diagnostic(folder);
}

model::FolderListing PlaybackController::list_folder(const model::FolderRef& folder) const {
    return scanner_.list_folder(folder);
}

std::optional<model::PlaylistRecord> PlaybackController::import_playlist(const model::FolderRef& folder,
                                                                         const std::string& name) {
    auto refs = scanner_.scan(folder);
    if (refs.empty()) {
        Logger::warn("PlaybackController: Not importing " + folder.identity + ", no media");
        return std::nullopt;
    }

    model::PlaylistRecord record;
    record.folder_identity = folder.identity;
    record.name = name;
    if (record.name.empty()) {
        std::string trimmed = folder.identity;
        while (trimmed.length() > 1 && trimmed.back() == '/') trimmed.pop_back();
        size_t slash = trimmed.find_last_of('/');
        record.name = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    }
    record.track_count = static_cast<int>(refs.size());
    record.imported_at = util::Platform::now_epoch_ms();

    int64_t id = store_->upsert_playlist(record);
    Logger::info("PlaybackController: Imported playlist " + std::to_string(id) + " \"" + record.name +
                 "\" with " + std::to_string(record.track_count) + " tracks");
    return store_->playlist_by_folder(folder.identity);
}

std::vector<model::PlaylistRecord> PlaybackController::playlists() const {
    return store_->playlists_by_last_played();
}

void PlaybackController::delete_playlist(int64_t id) {
    store_->delete_playlist(id);
}

std::optional<model::PlaybackMemory> PlaybackController::last_session() const {
    auto durable = store_->latest_memory();
    auto snapshot = snapshots_ ? snapshots_->last() : std::nullopt;
    if (snapshot && (!durable || snapshot->saved_at > durable->saved_at)) {
        return snapshot;
    }
    return durable;
}

// ---- Lifecycle ----

size_t PlaybackController::process_events() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_) return 0;
    return session_->process_pending_events();
}

void PlaybackController::release() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_) return;
    session_->release();
    session_.reset();
    Logger::info("PlaybackController: Session released");
}

bool PlaybackController::has_session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_ && !session_->is_released();
}

}  // namespace reprise::player
