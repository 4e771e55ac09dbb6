#pragma once

#include "merkle/Tree.hpp"

#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tl::sync {

// What the server remembers about a project between cycles. Hashes only.
struct PersistedProject {
    std::string projectId;
    std::string name;
    merkle::Tree tree;                                          // acknowledged snapshot
    std::map<std::string, std::vector<std::string>> chunks;    // path -> chunk hashes
    std::time_t registeredAt{};
    std::time_t lastSync{};
};

/**
 * Layout: <root>/projects/<digest(projectId)>/snapshot.json
 *
 * Writes go to a temp file that is renamed into place, so a crash leaves
 * either the previous or the new snapshot. Loads verify every tree hash.
 */
class StateStore {
public:
    explicit StateStore(std::filesystem::path root);

    [[nodiscard]] std::filesystem::path projectDir(const std::string& projectId) const;

    // Throws SnapshotError if the stored snapshot is corrupt.
    [[nodiscard]] std::optional<PersistedProject> load(const std::string& projectId) const;

    void save(const PersistedProject& project) const;

    // Project ids with a stored snapshot.
    [[nodiscard]] std::vector<std::string> list() const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

}
