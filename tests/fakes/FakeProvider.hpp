#pragma once

#include "backend/DocumentProvider.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace reprise::test {

// In-memory document tree. URIs are "tree:/" plus the slash-joined path.
class FakeProvider : public backend::DocumentProvider {
public:
    static constexpr const char* ROOT = "tree:/root";

    FakeProvider() { nodes_[ROOT] = {ROOT, "root", true}; }

    std::string add_file(const std::string& parent, const std::string& name) {
        std::string uri = parent + "/" + name;
        nodes_[uri] = {uri, name, false};
        children_[parent].push_back(uri);
        return uri;
    }

    std::string add_dir(const std::string& parent, const std::string& name) {
        std::string uri = parent + "/" + name;
        nodes_[uri] = {uri, name, true};
        children_[parent].push_back(uri);
        return uri;
    }

    void make_unreadable(const std::string& uri) { unreadable_.insert(uri); }
    void drop_listing(const std::string& uri) { no_listing_.insert(uri); }

    std::optional<backend::DocumentNode> resolve(const std::string& uri) override {
        auto it = nodes_.find(uri);
        if (it == nodes_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::vector<backend::DocumentNode>> list_children(const backend::DocumentNode& node) override {
        ++list_calls;
        if (no_listing_.count(node.uri)) return std::nullopt;
        std::vector<backend::DocumentNode> out;
        for (const auto& uri : children_[node.uri]) {
            out.push_back(nodes_[uri]);
        }
        return out;
    }

    bool exists(const backend::DocumentNode& node) override { return nodes_.count(node.uri) > 0; }
    bool can_read(const backend::DocumentNode& node) override { return unreadable_.count(node.uri) == 0; }

    int list_calls = 0;

private:
    std::map<std::string, backend::DocumentNode> nodes_;
    std::map<std::string, std::vector<std::string>> children_;
    std::set<std::string> unreadable_;
    std::set<std::string> no_listing_;
};

}  // namespace reprise::test
