#pragma once

#include "merkle/Node.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tl::merkle {

class Builder;

// Immutable Merkle tree over a file hierarchy. Only Builder creates non-empty trees.
class Tree {
public:
    using Index = Node::Index;
    static constexpr Index ROOT = 0;

    // Tree with no files; its root hash is the digest of the empty string.
    Tree();

    [[nodiscard]] const std::string& rootHash() const { return nodes_[ROOT].hash; }
    [[nodiscard]] const Node& root() const { return nodes_[ROOT]; }
    [[nodiscard]] const Node& node(Index i) const { return nodes_.at(i); }

    [[nodiscard]] bool empty() const { return nodes_[ROOT].children.empty(); }
    [[nodiscard]] size_t nodeCount() const { return nodes_.size(); }
    [[nodiscard]] size_t fileCount() const;

    // "" is the root. Walks from the root by path component.
    [[nodiscard]] std::optional<Index> find(std::string_view path) const;

    [[nodiscard]] std::optional<std::string> leafHash(std::string_view path) const;

    // path -> hash for every file, sorted by path
    [[nodiscard]] std::map<std::string, std::string> leaves() const;

    // Hash of a directory from (name, hash) pairs, which must already be sorted by name.
    static std::string directoryHash(const std::vector<std::pair<std::string_view, std::string_view>>& sortedChildren);

    static const std::string& emptyHash();

private:
    friend class Builder;

    std::vector<Node> nodes_;

    void collectLeaves(Index i, const std::string& prefix, std::map<std::string, std::string>& out) const;
};

// Relative '/'-separated path with no empty, "." or ".." components.
[[nodiscard]] bool isValidPath(std::string_view path);

// Valid single path component.
[[nodiscard]] bool isValidName(std::string_view name);

}
