#include "backend/FilesystemDocumentProvider.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"

namespace reprise::backend {

using util::DirectoryScanner;

std::string FilesystemDocumentProvider::to_uri(const std::string& absolute_path) {
    return "file://" + DirectoryScanner::normalize(absolute_path);
}

std::optional<DocumentNode> FilesystemDocumentProvider::resolve(const std::string& uri) {
    auto path = util::Platform::local_path_from_uri(uri);
    if (!path) {
        util::Logger::debug("FilesystemDocumentProvider: Not a file URI: " + uri);
        return std::nullopt;
    }

    std::string normalized = DirectoryScanner::normalize(*path);
    if (!DirectoryScanner::exists(normalized)) {
        return std::nullopt;
    }

    DocumentNode node;
    node.uri = to_uri(normalized);
    size_t slash = normalized.find_last_of('/');
    node.name = slash == std::string::npos ? normalized : normalized.substr(slash + 1);
    node.is_directory = DirectoryScanner::is_directory(normalized);
    return node;
}

std::optional<std::vector<DocumentNode>> FilesystemDocumentProvider::list_children(const DocumentNode& node) {
    auto path = util::Platform::local_path_from_uri(node.uri);
    if (!path) return std::nullopt;

    auto listing = DirectoryScanner::list_directory(*path);
    if (listing.status != DirectoryScanner::OpenStatus::Ok) {
        return std::nullopt;
    }

    std::vector<DocumentNode> children;
    children.reserve(listing.entries.size());
    for (const auto& entry : listing.entries) {
        DocumentNode child;
        child.uri = DirectoryScanner::join(node.uri, entry.name);
        child.name = entry.name;
        child.is_directory = entry.is_directory;
        children.push_back(std::move(child));
    }
    return children;
}

bool FilesystemDocumentProvider::exists(const DocumentNode& node) {
    auto path = util::Platform::local_path_from_uri(node.uri);
    return path && DirectoryScanner::exists(*path);
}

bool FilesystemDocumentProvider::can_read(const DocumentNode& node) {
    auto path = util::Platform::local_path_from_uri(node.uri);
    return path && DirectoryScanner::is_readable(*path);
}

}  // namespace reprise::backend
