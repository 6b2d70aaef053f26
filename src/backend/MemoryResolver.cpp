#include "backend/MemoryResolver.hpp"
#include "util/Formatting.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"

namespace reprise::backend {

using util::Logger;

MemoryResolver::MemoryResolver(std::shared_ptr<MemoryStore> store,
                               std::shared_ptr<SnapshotStore> snapshots,
                               events::EventBus* bus)
    : store_(std::move(store)), snapshots_(std::move(snapshots)), bus_(bus) {}

std::optional<model::PlaybackMemory> MemoryResolver::resolve_resume(const model::MediaRef& ref) const {
    auto durable = store_->get_memory(ref.identity());

    std::optional<model::PlaybackMemory> snapshot;
    if (snapshots_) {
        snapshot = snapshots_->last();
        if (snapshot && snapshot->file_identity != ref.identity()) {
            snapshot.reset();
        }
    }

    if (snapshot && (!durable || snapshot->saved_at > durable->saved_at)) {
        Logger::debug("MemoryResolver: Resume " + ref.identity() + " from snapshot at " +
                      std::to_string(snapshot->position_ms) + "ms");
        return snapshot;
    }

    if (durable) {
        Logger::debug("MemoryResolver: Resume " + ref.identity() + " at " +
                      std::to_string(durable->position_ms) + "ms");
        return durable;
    }

    auto by_name = store_->get_memory_by_display_name(ref.display_name());
    if (by_name) {
        Logger::info("MemoryResolver: Resume " + ref.identity() + " by display name from " +
                     by_name->file_identity);
        return by_name;
    }

    Logger::debug("MemoryResolver: No memory for " + ref.identity());
    return std::nullopt;
}

void MemoryResolver::save_memory(const model::MediaRef& ref, int64_t position_ms, int64_t duration_ms,
                                 const std::string& folder_identity, const std::string& display_name,
                                 int64_t saved_at) {
    model::PlaybackMemory memory;
    memory.file_identity = ref.identity();
    memory.position_ms = position_ms;
    memory.duration_ms = duration_ms;
    memory.folder_identity = folder_identity;
    memory.display_name = display_name;
    memory.saved_at = saved_at > 0 ? saved_at : util::Platform::now_epoch_ms();
    store_->upsert_memory(memory);
}

void MemoryResolver::save_snapshot(const model::MediaRef& ref, int64_t position_ms, int64_t duration_ms,
                                   const std::string& folder_identity, const std::string& display_name) {
    if (!snapshots_) return;
    snapshots_->put(ref.identity(), position_ms, duration_ms, folder_identity, display_name);
}

std::optional<model::SavedResult> MemoryResolver::save_memory_manually(const model::Snapshot& state) {
    if (!state.current_ref) {
        Logger::debug("MemoryResolver: Manual save without a current item");
        return std::nullopt;
    }

    const auto& ref = *state.current_ref;
    save_snapshot(ref, state.position_ms, state.duration_ms, state.folder_identity, state.display_name);
    save_memory(ref, state.position_ms, state.duration_ms, state.folder_identity, state.display_name);

    Logger::info("MemoryResolver: Saved " + state.display_name + " at " + util::format_time(state.position_ms));
    announce({ref.identity(), state.position_ms, state.display_name, false});

    return model::SavedResult{ref.identity(), state.position_ms, state.duration_ms, state.display_name};
}

void MemoryResolver::announce(const model::MemorySaveEvent& event) {
    if (!bus_) return;
    events::Event e{events::Event::Type::MemorySaved};
    e.data = event.file_identity;
    e.memory = event;
    bus_->publish(e);
}

std::string MemoryResolver::default_bookmark_label(int64_t position_ms) {
    return "Bookmark " + util::format_time(position_ms);
}

int64_t MemoryResolver::add_bookmark(const model::MediaRef& ref, int64_t position_ms, int64_t duration_ms,
                                     const std::string& label, const std::string& folder_identity,
                                     const std::string& display_name) {
    model::Bookmark bookmark;
    bookmark.file_identity = ref.identity();
    bookmark.position_ms = position_ms;
    bookmark.duration_ms = duration_ms;
    bookmark.label = label.empty() ? default_bookmark_label(position_ms) : label;
    bookmark.created_at = util::Platform::now_epoch_ms();
    bookmark.folder_identity = folder_identity;
    bookmark.display_name = display_name;

    int64_t id = store_->insert_bookmark(bookmark);
    Logger::info("MemoryResolver: Bookmark " + std::to_string(id) + " \"" + bookmark.label + "\" on " + ref.identity());
    return id;
}

void MemoryResolver::delete_bookmark(int64_t id) {
    store_->delete_bookmark(id);
}

void MemoryResolver::rename_bookmark(int64_t id, const std::string& label) {
    store_->update_bookmark_label(id, label);
}

std::vector<model::Bookmark> MemoryResolver::bookmarks_for(const std::string& file_identity) const {
    return store_->bookmarks_for(file_identity);
}

std::vector<model::Bookmark> MemoryResolver::all_bookmarks() const {
    return store_->all_bookmarks();
}

void MemoryResolver::delete_memory(const std::string& file_identity) {
    store_->delete_memory(file_identity);
    // The snapshot is a resume candidate too
    if (snapshots_) snapshots_->erase(file_identity);
}

void MemoryResolver::clear_all() {
    Logger::info("MemoryResolver: Clearing all memories");
    store_->delete_all_memories();
    if (snapshots_) snapshots_->clear();
}

std::vector<model::PlaybackMemory> MemoryResolver::all_memories() const {
    return store_->all_memories();
}

std::vector<model::PlaybackMemory> MemoryResolver::memories_in_folder(const std::string& folder_identity) const {
    return store_->memories_in_folder(folder_identity);
}

std::optional<model::PlaybackMemory> MemoryResolver::latest_memory() const {
    return store_->latest_memory();
}

}  // namespace reprise::backend
