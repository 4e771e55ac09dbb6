#include "sync/StateStore.hpp"
#include "merkle/Snapshot.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>

using namespace tl::sync;
using nlohmann::json;

static constexpr auto SNAPSHOT_FILE = "snapshot.json";

StateStore::StateStore(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_ / "projects");
}

std::filesystem::path StateStore::projectDir(const std::string& projectId) const {
    return root_ / "projects" / crypto::hash::blake2b(projectId);
}

static std::time_t timeField(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return 0;
    return tl::util::parseTimestampFromString(j.at(key).get<std::string>());
}

static PersistedProject parse(const json& j) {
    PersistedProject p;
    j.at("projectId").get_to(p.projectId);
    p.name = j.value("name", std::string{});
    p.tree = tl::merkle::deserialize(j.at("tree"));
    if (j.at("rootHash").get<std::string>() != p.tree.rootHash())
        throw tl::SnapshotError("Stored root hash disagrees with stored tree for " + p.projectId);
    p.chunks = j.value("chunks", std::map<std::string, std::vector<std::string>>{});
    p.registeredAt = timeField(j, "registeredAt");
    p.lastSync = timeField(j, "lastSync");

    for (const auto& [path, _] : p.chunks)
        if (!p.tree.leafHash(path)) throw tl::SnapshotError("Chunk list for untracked path " + path);
    return p;
}

std::optional<PersistedProject> StateStore::load(const std::string& projectId) const {
    const auto file = projectDir(projectId) / SNAPSHOT_FILE;
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) return std::nullopt;

    try {
        auto p = parse(json::parse(util::readFileToString(file)));
        if (p.projectId != projectId) throw SnapshotError("Snapshot at " + file.string() + " belongs to " + p.projectId);
        log::Registry::sync()->debug("[StateStore] Loaded {} (root {})", projectId, p.tree.rootHash());
        return p;
    } catch (const SnapshotError&) {
        throw;
    } catch (const json::exception& e) {
        log::Registry::merkle()->error("[StateStore] Corrupt snapshot {}: {}", file.string(), e.what());
        throw SnapshotError("Corrupt snapshot " + file.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        log::Registry::merkle()->error("[StateStore] Unreadable snapshot {}: {}", file.string(), e.what());
        throw SnapshotError("Unreadable snapshot " + file.string() + ": " + e.what());
    }
}

void StateStore::save(const PersistedProject& p) const {
    const json j = {
        {"projectId", p.projectId},
        {"name", p.name},
        {"rootHash", p.tree.rootHash()},
        {"tree", merkle::serialize(p.tree)},
        {"chunks", p.chunks},
        {"registeredAt", p.registeredAt ? json(util::timestampToString(p.registeredAt)) : json(nullptr)},
        {"lastSync", p.lastSync ? json(util::timestampToString(p.lastSync)) : json(nullptr)}
    };
    util::writeFileAtomic(projectDir(p.projectId) / SNAPSHOT_FILE, j.dump());
}

std::vector<std::string> StateStore::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(root_ / "projects", ec)) {
        const auto file = entry.path() / SNAPSHOT_FILE;
        if (!std::filesystem::exists(file, ec)) continue;
        try {
            const auto j = json::parse(util::readFileToString(file));
            ids.push_back(j.at("projectId").get<std::string>());
        } catch (const std::exception& e) {
            log::Registry::sync()->warn("[StateStore] Skipping unreadable snapshot {}: {}", file.string(), e.what());
        }
    }
    if (ec) log::Registry::sync()->warn("[StateStore] Unable to list {}: {}", (root_ / "projects").string(), ec.message());
    std::ranges::sort(ids);
    return ids;
}
