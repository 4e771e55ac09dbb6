#pragma once

#include "merkle/Tree.hpp"

#include <nlohmann/json_fwd.hpp>

namespace tl::merkle {

// {"rootHash", "root": {"name", "kind", "hash", "children": [...]}}
nlohmann::json serialize(const Tree& tree);

// Recomputes every directory hash and the root hash. Throws SnapshotError on any disagreement,
// an unsorted or duplicate child, an empty subdirectory or a malformed node.
Tree deserialize(const nlohmann::json& j);

}
