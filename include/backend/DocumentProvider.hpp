#pragma once

#include <optional>
#include <string>
#include <vector>

namespace reprise::backend {

struct DocumentNode {
    std::string uri;
    std::string name;
    bool is_directory = false;

    bool is_file() const { return !is_directory; }
};

/// Document-tree access by URI. Implementations are expected to be
/// blocking; callers run them off the session context.
class DocumentProvider {
public:
    virtual ~DocumentProvider() = default;

    // nullopt when the URI does not resolve to a node
    virtual std::optional<DocumentNode> resolve(const std::string& uri) = 0;

    // nullopt when the provider returns no listing for the node
    virtual std::optional<std::vector<DocumentNode>> list_children(const DocumentNode& node) = 0;

    virtual bool exists(const DocumentNode& node) = 0;
    virtual bool can_read(const DocumentNode& node) = 0;
};

}  // namespace reprise::backend
