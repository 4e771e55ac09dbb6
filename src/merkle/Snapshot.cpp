#include "merkle/Snapshot.hpp"
#include "merkle/Builder.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <nlohmann/json.hpp>

using namespace tl::merkle;
using nlohmann::json;

static json nodeToJson(const Tree& t, const Tree::Index i) {
    const auto& n = t.node(i);
    json j = {
        {"name", n.name},
        {"kind", to_string(n.kind)},
        {"hash", n.hash}
    };
    if (n.isDirectory()) {
        j["children"] = json::array();
        for (const auto c : n.children) j["children"].push_back(nodeToJson(t, c));
    }
    return j;
}

json tl::merkle::serialize(const Tree& tree) {
    return {
        {"rootHash", tree.rootHash()},
        {"root", nodeToJson(tree, Tree::ROOT)}
    };
}

// Verifies j and everything below it, adding file leaves to out. Returns the verified hash.
static std::string verifyNode(const json& j, const std::string& path, const bool isRoot,
                              std::map<std::string, std::string>& out) {
    if (!j.is_object()) throw tl::SnapshotError("Snapshot node is not an object at '" + path + "'");

    const auto name = j.value("name", std::string{});
    const auto kind = j.value("kind", std::string{});
    const auto hash = j.value("hash", std::string{});

    if (!isRoot && !isValidName(name)) throw tl::SnapshotError("Invalid node name '" + name + "' under '" + path + "'");
    if (!tl::crypto::hash::isDigest(hash)) throw tl::SnapshotError("Malformed hash at '" + path + "'");

    const auto self = isRoot ? std::string{} : (path.empty() ? name : path + '/' + name);

    if (kind == "file") {
        if (isRoot) throw tl::SnapshotError("Snapshot root must be a directory");
        out.emplace(self, hash);
        return hash;
    }

    if (kind != "directory") throw tl::SnapshotError("Unknown node kind '" + kind + "' at '" + self + "'");

    const auto it = j.find("children");
    if (it == j.end() || !it->is_array()) throw tl::SnapshotError("Directory without children array at '" + self + "'");
    if (it->empty() && !isRoot) throw tl::SnapshotError("Empty directory in snapshot at '" + self + "'");

    std::vector<std::string> names, hashes;
    for (const auto& child : *it) {
        hashes.push_back(verifyNode(child, self, false, out));
        names.push_back(child.value("name", std::string{}));
        if (names.size() > 1 && !(names[names.size() - 2] < names.back()))
            throw tl::SnapshotError("Children not strictly sorted by name at '" + self + "'");
    }

    std::vector<std::pair<std::string_view, std::string_view>> pairs;
    for (size_t i = 0; i < names.size(); ++i) pairs.emplace_back(names[i], hashes[i]);

    const auto expected = names.empty() ? Tree::emptyHash() : Tree::directoryHash(pairs);
    if (expected != hash) throw tl::SnapshotError("Directory hash mismatch at '" + (self.empty() ? "/" : self) + "'");
    return hash;
}

Tree tl::merkle::deserialize(const json& j) {
    try {
        if (!j.is_object() || !j.contains("root")) throw SnapshotError("Snapshot is missing its root node");

        std::map<std::string, std::string> leaves;
        const auto rootHash = verifyNode(j.at("root"), "", true, leaves);

        if (j.contains("rootHash") && j.at("rootHash").get<std::string>() != rootHash)
            throw SnapshotError("Snapshot root hash does not match its root node");

        auto tree = Builder::fromLeaves(leaves);
        if (tree.rootHash() != rootHash) throw SnapshotError("Rebuilt snapshot disagrees with its root hash");
        return tree;
    } catch (const json::exception& e) {
        log::Registry::merkle()->warn("[Snapshot] Malformed snapshot: {}", e.what());
        throw SnapshotError(std::string("Malformed snapshot: ") + e.what());
    } catch (const SnapshotError& e) {
        log::Registry::merkle()->warn("[Snapshot] Rejected snapshot: {}", e.what());
        throw;
    }
}
