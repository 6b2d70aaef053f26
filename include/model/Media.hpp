#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reprise::model {

enum class RefKind {
    Path,         // Absolute filesystem path
    ProviderUri,  // Document-provider URI
};

/// One playable file. Identity is the absolute path or the provider URI and
/// is unique within a playlist. Immutable after construction.
class MediaRef {
public:
    static MediaRef from_path(const std::string& absolute_path);

    // Provider URIs are opaque, so the file name comes from the provider
    static MediaRef from_uri(const std::string& uri, const std::string& file_name);

    RefKind kind() const { return kind_; }
    const std::string& identity() const { return identity_; }
    const std::string& display_name() const { return display_name_; }
    const std::string& extension() const { return extension_; }
    const std::string& file_name() const { return file_name_; }

    bool operator==(const MediaRef&) const = default;

private:
    MediaRef(RefKind kind, std::string identity, const std::string& file_name);

    RefKind kind_ = RefKind::Path;
    std::string identity_;
    std::string file_name_;
    std::string display_name_;
    std::string extension_;
};

struct FolderRef {
    RefKind kind = RefKind::Path;
    std::string identity;  // Directory path or tree URI

    static FolderRef path(std::string dir) { return {RefKind::Path, std::move(dir)}; }
    static FolderRef uri(std::string tree_uri) { return {RefKind::ProviderUri, std::move(tree_uri)}; }

    bool operator==(const FolderRef&) const = default;
};

struct PathList {
    std::vector<MediaRef> items;
    bool operator==(const PathList&) const = default;
};

struct UriList {
    std::vector<MediaRef> items;
    bool operator==(const UriList&) const = default;
};

/// Ordered queue of one access mode only. The variant makes a mixed
/// playlist unrepresentable.
struct Playlist {
    std::variant<PathList, UriList> entries;
    std::string folder_identity;
    std::optional<int64_t> playlist_id;

    RefKind mode() const {
        return std::holds_alternative<PathList>(entries) ? RefKind::Path : RefKind::ProviderUri;
    }

    const std::vector<MediaRef>& items() const {
        return std::visit([](const auto& list) -> const std::vector<MediaRef>& { return list.items; }, entries);
    }

    size_t size() const { return items().size(); }
    bool empty() const { return items().empty(); }

    const MediaRef* at(int index) const {
        if (index < 0 || static_cast<size_t>(index) >= size()) return nullptr;
        return &items()[static_cast<size_t>(index)];
    }

    bool operator==(const Playlist&) const = default;
};

enum class ScanStatus {
    Done,  // Playable
    Pass,  // Skipped: unsupported format
    Err,   // Could not be read
};

struct ScanResultItem {
    std::string name;      // Relative to the scanned root
    std::string identity;  // Absolute path or URI ("" when nothing could be resolved)
    ScanStatus status = ScanStatus::Done;
    std::optional<std::string> reason;

    bool operator==(const ScanResultItem&) const = default;
};

/// Counts are derived from the items, so done + pass + err == total always holds.
struct ScanResult {
    std::vector<ScanResultItem> items;

    size_t total() const { return items.size(); }
    size_t done_count() const { return count(ScanStatus::Done); }
    size_t pass_count() const { return count(ScanStatus::Pass); }
    size_t err_count() const { return count(ScanStatus::Err); }

private:
    size_t count(ScanStatus status) const {
        size_t n = 0;
        for (const auto& item : items) {
            if (item.status == status) ++n;
        }
        return n;
    }
};

struct FolderListing {
    std::vector<FolderRef> folders;  // Sorted by name
    std::vector<MediaRef> files;     // Sorted by name, after the folders
};

std::string to_string(ScanStatus status);

// "[done] a.mp3", "[pass] b.txt", "[err] d: unreadable"
std::string describe(const ScanResultItem& item);

} // namespace reprise::model
