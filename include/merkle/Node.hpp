#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tl::merkle {

enum class NodeKind : uint8_t { File, Directory };

std::string_view to_string(NodeKind k);

// Arena node. Children are indices into the owning Tree, sorted by name.
struct Node {
    using Index = uint32_t;

    std::string name;
    NodeKind kind = NodeKind::File;
    std::string hash;
    std::vector<Index> children;

    [[nodiscard]] bool isFile() const { return kind == NodeKind::File; }
    [[nodiscard]] bool isDirectory() const { return kind == NodeKind::Directory; }
};

}
