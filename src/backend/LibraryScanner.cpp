#include "backend/LibraryScanner.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace reprise::backend {

using model::RefKind;
using util::DirectoryScanner;
using util::Logger;
using util::Platform;

namespace {

std::string base_name(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

LibraryScanner::LibraryScanner(std::shared_ptr<DocumentProvider> provider)
    : provider_(std::move(provider)) {}

std::string LibraryScanner::unsupported_reason(const std::string& extension) {
    if (extension.empty()) return "unsupported format";
    return "unsupported format (." + extension + ")";
}

LibraryScanner::ChildListing LibraryScanner::open_root(const model::FolderRef& folder, Child& root) const {
    root.is_directory = true;

    if (folder.kind == RefKind::Path) {
        root.identity = DirectoryScanner::normalize(folder.identity);
        root.name = base_name(root.identity);
        return list_dir(RefKind::Path, root);
    }

    root.identity = folder.identity;
    root.name = folder.identity;

    if (!provider_) {
        Logger::warn("LibraryScanner: No document provider for " + folder.identity);
        return {REASON_NO_LISTING, {}};
    }

    auto node = provider_->resolve(folder.identity);
    if (!node || !node->is_directory || !provider_->exists(*node)) {
        return {REASON_NOT_FOUND, {}};
    }

    root.name = node->name;
    root.node = std::move(node);
    return list_dir(RefKind::ProviderUri, root);
}

LibraryScanner::ChildListing LibraryScanner::list_dir(RefKind kind, const Child& dir) const {
    ChildListing result;

    if (kind == RefKind::Path) {
        auto listing = DirectoryScanner::list_directory(dir.identity);
        switch (listing.status) {
            case DirectoryScanner::OpenStatus::Ok:
                break;
            case DirectoryScanner::OpenStatus::NotFound:
            case DirectoryScanner::OpenStatus::NotDirectory:
                result.error = REASON_NOT_FOUND;
                return result;
            case DirectoryScanner::OpenStatus::Unreadable:
                result.error = REASON_UNREADABLE;
                return result;
        }

        result.children.reserve(listing.entries.size());
        for (auto& entry : listing.entries) {
            Child child;
            child.identity = DirectoryScanner::join(dir.identity, entry.name);
            child.name = std::move(entry.name);
            child.is_directory = entry.is_directory;
            result.children.push_back(std::move(child));
        }
        return result;
    }

    if (!provider_ || !dir.node) {
        result.error = REASON_NO_LISTING;
        return result;
    }

    if (!provider_->can_read(*dir.node)) {
        result.error = REASON_UNREADABLE;
        return result;
    }

    auto nodes = provider_->list_children(*dir.node);
    if (!nodes) {
        result.error = REASON_NO_LISTING;
        return result;
    }

    result.children.reserve(nodes->size());
    for (auto& node : *nodes) {
        Child child;
        child.name = node.name;
        child.identity = node.uri;
        child.is_directory = node.is_directory;
        child.node = std::move(node);
        result.children.push_back(std::move(child));
    }
    return result;
}

std::vector<model::MediaRef> LibraryScanner::scan(const model::FolderRef& folder) const {
    Logger::info("LibraryScanner: Scanning " + folder.identity);

    std::vector<model::MediaRef> refs;
    Child root;
    auto listing = open_root(folder, root);
    if (listing.error) {
        Logger::warn("LibraryScanner: Cannot scan " + folder.identity + ": " + *listing.error);
        return refs;
    }

    collect(folder.kind, listing.children, refs);

    // One global order across all subfolders
    std::sort(refs.begin(), refs.end(), [](const model::MediaRef& a, const model::MediaRef& b) {
        int cmp = util::case_insensitive_compare(a.display_name(), b.display_name());
        if (cmp != 0) return cmp < 0;
        if (a.display_name() != b.display_name()) return a.display_name() < b.display_name();
        return a.identity() < b.identity();
    });

    Logger::info("LibraryScanner: Found " + std::to_string(refs.size()) + " media files");
    return refs;
}

void LibraryScanner::collect(RefKind kind, const std::vector<Child>& children,
                             std::vector<model::MediaRef>& out) const {
    for (const auto& child : children) {
        if (child.is_directory) {
            auto sub = list_dir(kind, child);
            if (sub.error) {
                Logger::debug("LibraryScanner: Skipping " + child.identity + ": " + *sub.error);
                continue;
            }
            collect(kind, sub.children, out);
        } else if (Platform::is_media_extension(Platform::extension_of(child.name))) {
            out.push_back(to_media_ref(kind, child));
        }
    }
}

model::ScanResult LibraryScanner::scan_diagnostic(const model::FolderRef& folder) const {
    Logger::info("LibraryScanner: Diagnostic scan of " + folder.identity);

    model::ScanResult result;
    Child root;
    auto listing = open_root(folder, root);
    if (listing.error) {
        Logger::warn("LibraryScanner: Diagnostic scan failed for " + folder.identity + ": " + *listing.error);
        model::ScanResultItem item;
        item.name = root.name.empty() ? folder.identity : root.name;
        item.identity = folder.identity;
        item.status = model::ScanStatus::Err;
        item.reason = *listing.error;
        result.items.push_back(std::move(item));
        return result;
    }

    diagnose(folder.kind, std::move(listing.children), "", result);

    Logger::info("LibraryScanner: Diagnostic " + std::to_string(result.total()) + " entries, " +
                 std::to_string(result.done_count()) + " done, " +
                 std::to_string(result.pass_count()) + " pass, " +
                 std::to_string(result.err_count()) + " err");
    return result;
}

void LibraryScanner::diagnose(RefKind kind, std::vector<Child> children, const std::string& relative,
                              model::ScanResult& result) const {
    sort_by_name(children);

    for (const auto& child : children) {
        model::ScanResultItem item;
        item.name = relative.empty() ? child.name : relative + "/" + child.name;
        item.identity = child.identity;

        if (child.is_directory) {
            auto sub = list_dir(kind, child);
            if (sub.error) {
                item.status = model::ScanStatus::Err;
                item.reason = *sub.error;
                result.items.push_back(std::move(item));
                continue;
            }
            // Subfolder contents take the subfolder's place in the order
            diagnose(kind, std::move(sub.children), item.name, result);
            continue;
        }

        std::string extension = Platform::extension_of(child.name);
        if (!Platform::is_media_extension(extension)) {
            item.status = model::ScanStatus::Pass;
            item.reason = unsupported_reason(extension);
        } else if (!is_readable(kind, child)) {
            item.status = model::ScanStatus::Err;
            item.reason = REASON_UNREADABLE;
        } else {
            item.status = model::ScanStatus::Done;
        }
        result.items.push_back(std::move(item));
    }
}

model::FolderListing LibraryScanner::list_folder(const model::FolderRef& folder) const {
    model::FolderListing listing;
    Child root;
    auto children = open_root(folder, root);
    if (children.error) {
        Logger::warn("LibraryScanner: Cannot list " + folder.identity + ": " + *children.error);
        return listing;
    }

    sort_by_name(children.children);

    for (const auto& child : children.children) {
        if (child.is_directory) {
            listing.folders.push_back(model::FolderRef{folder.kind, child.identity});
        } else if (Platform::is_media_extension(Platform::extension_of(child.name))) {
            listing.files.push_back(to_media_ref(folder.kind, child));
        }
    }

    Logger::debug("LibraryScanner: Listed " + folder.identity + ": " +
                  std::to_string(listing.folders.size()) + " folders, " +
                  std::to_string(listing.files.size()) + " files");
    return listing;
}

bool LibraryScanner::is_readable(RefKind kind, const Child& child) const {
    if (kind == RefKind::Path) {
        return DirectoryScanner::is_readable(child.identity);
    }
    return provider_ && child.node && provider_->can_read(*child.node);
}

model::MediaRef LibraryScanner::to_media_ref(RefKind kind, const Child& child) {
    if (kind == RefKind::Path) {
        return model::MediaRef::from_path(child.identity);
    }
    return model::MediaRef::from_uri(child.identity, child.name);
}

void LibraryScanner::sort_by_name(std::vector<Child>& children) {
    std::sort(children.begin(), children.end(), [](const Child& a, const Child& b) {
        return util::name_less(a.name, b.name);
    });
}

}  // namespace reprise::backend
