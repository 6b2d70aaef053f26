#pragma once

#include "backend/DocumentProvider.hpp"
#include "model/Media.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reprise::backend {

/**
 * LibraryScanner: discovers playable media under a folder.
 *
 * Path folders are walked with DirectoryScanner (getdents64); provider
 * folders are walked through the DocumentProvider. Three walks exist
 * because their orderings differ:
 *   scan()            recursive, one global sort by display name (queue building)
 *   scan_diagnostic() recursive, name order per level, subfolders in place
 *   list_folder()     one level, folders then files (browsing)
 */
class LibraryScanner {
public:
    explicit LibraryScanner(std::shared_ptr<DocumentProvider> provider = nullptr);

    // Missing or unreadable folders yield an empty list
    [[nodiscard]] std::vector<model::MediaRef> scan(const model::FolderRef& folder) const;

    // Never throws. Root failures come back as a single Err entry.
    [[nodiscard]] model::ScanResult scan_diagnostic(const model::FolderRef& folder) const;

    [[nodiscard]] model::FolderListing list_folder(const model::FolderRef& folder) const;

    static constexpr const char* REASON_NOT_FOUND = "not found";
    static constexpr const char* REASON_UNREADABLE = "unreadable";
    static constexpr const char* REASON_NO_LISTING = "no listing";

    // "unsupported format (.txt)", or "unsupported format" without an extension
    static std::string unsupported_reason(const std::string& extension);

private:
    struct Child {
        std::string name;
        std::string identity;
        bool is_directory = false;
        std::optional<DocumentNode> node;  // Provider mode only
    };

    struct ChildListing {
        std::optional<std::string> error;  // Reason the folder could not be listed
        std::vector<Child> children;
    };

    // Resolves the folder itself; fills error when it cannot be found
    ChildListing open_root(const model::FolderRef& folder, Child& root) const;
    ChildListing list_dir(model::RefKind kind, const Child& dir) const;

    void collect(model::RefKind kind, const std::vector<Child>& children,
                 std::vector<model::MediaRef>& out) const;
    void diagnose(model::RefKind kind, std::vector<Child> children, const std::string& relative,
                  model::ScanResult& result) const;

    bool is_readable(model::RefKind kind, const Child& child) const;
    static model::MediaRef to_media_ref(model::RefKind kind, const Child& child);
    static void sort_by_name(std::vector<Child>& children);

    std::shared_ptr<DocumentProvider> provider_;
};

}  // namespace reprise::backend
