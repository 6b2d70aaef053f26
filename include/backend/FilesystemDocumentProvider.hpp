#pragma once

#include "backend/DocumentProvider.hpp"

namespace reprise::backend {

/// DocumentProvider over the local filesystem using file:// URIs.
/// Child URIs are the parent URI joined with the raw child name.
class FilesystemDocumentProvider : public DocumentProvider {
public:
    std::optional<DocumentNode> resolve(const std::string& uri) override;
    std::optional<std::vector<DocumentNode>> list_children(const DocumentNode& node) override;
    bool exists(const DocumentNode& node) override;
    bool can_read(const DocumentNode& node) override;

    static std::string to_uri(const std::string& absolute_path);
};

}  // namespace reprise::backend
