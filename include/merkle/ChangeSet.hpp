#pragma once

#include <set>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tl::merkle {

// File paths only. Renames appear as removed + added.
struct ChangeSet {
    std::set<std::string> added, modified, removed;

    [[nodiscard]] bool empty() const { return added.empty() && modified.empty() && removed.empty(); }
    [[nodiscard]] size_t size() const { return added.size() + modified.size() + removed.size(); }

    // added ∪ modified
    [[nodiscard]] bool needsContent(const std::string& path) const {
        return added.contains(path) || modified.contains(path);
    }

    [[nodiscard]] bool operator==(const ChangeSet&) const = default;
};

void to_json(nlohmann::json& j, const ChangeSet& c);
void from_json(const nlohmann::json& j, ChangeSet& c);

}
