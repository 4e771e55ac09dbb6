#include "merkle/Builder.hpp"
#include "fs/Enumerator.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <memory>

using namespace tl::merkle;

namespace {

struct DirEntry {
    std::map<std::string, std::unique_ptr<DirEntry>> dirs;
    std::map<std::string, std::string> files;
};

}

// Emits dir and its subtree into the arena. Returns the dir's index.
static Tree::Index emit(std::vector<Node>& nodes, const DirEntry& dir, std::string name) {
    const auto self = static_cast<Tree::Index>(nodes.size());
    nodes.push_back(Node{.name = std::move(name), .kind = NodeKind::Directory, .hash = {}, .children = {}});

    // merge files and subdirectories in name order
    std::vector<Tree::Index> children;
    auto f = dir.files.begin();
    auto d = dir.dirs.begin();
    while (f != dir.files.end() || d != dir.dirs.end()) {
        if (d == dir.dirs.end() || (f != dir.files.end() && f->first < d->first)) {
            children.push_back(static_cast<Tree::Index>(nodes.size()));
            nodes.push_back(Node{.name = f->first, .kind = NodeKind::File, .hash = f->second, .children = {}});
            ++f;
        } else {
            children.push_back(emit(nodes, *d->second, d->first));
            ++d;
        }
    }

    std::vector<std::pair<std::string_view, std::string_view>> pairs;
    pairs.reserve(children.size());
    for (const auto c : children) pairs.emplace_back(nodes[c].name, nodes[c].hash);

    nodes[self].hash = children.empty() ? Tree::emptyHash() : Tree::directoryHash(pairs);
    nodes[self].children = std::move(children);
    return self;
}

Tree Builder::fromLeaves(const std::map<std::string, std::string>& leaves) {
    DirEntry root;

    for (const auto& [path, hash] : leaves) {
        if (!isValidPath(path)) throw SnapshotError("Invalid path in tree: " + path);
        if (!crypto::hash::isDigest(hash)) throw SnapshotError("Malformed leaf hash for " + path);

        DirEntry* cur = &root;
        size_t start = 0;
        for (auto slash = path.find('/'); slash != std::string::npos; slash = path.find('/', start)) {
            const auto comp = path.substr(start, slash - start);
            if (cur->files.contains(comp)) throw SnapshotError("Path is both a file and a directory: " + path);
            auto& next = cur->dirs[comp];
            if (!next) next = std::make_unique<DirEntry>();
            cur = next.get();
            start = slash + 1;
        }

        const auto name = path.substr(start);
        if (cur->dirs.contains(name)) throw SnapshotError("Path is both a file and a directory: " + path);
        cur->files.emplace(name, hash);
    }

    Tree t;
    t.nodes_.clear();
    emit(t.nodes_, root, "");
    return t;
}

Tree Builder::fromRecords(const std::vector<fs::model::FileRecord>& records) {
    std::map<std::string, std::string> leaves;
    for (const auto& r : records) leaves[r.path] = r.contentHash;
    return fromLeaves(leaves);
}

BuildResult Builder::build(const std::filesystem::path& root, const fs::Enumerator& enumerator) {
    auto enumerated = enumerator.enumerate(root);
    auto tree = fromRecords(enumerated.records);

    log::Registry::merkle()->debug("[Builder] Built tree for {}: root {} over {} files",
                                   root.string(), tree.rootHash(), enumerated.records.size());

    return {std::move(tree), std::move(enumerated.records), std::move(enumerated.rejects)};
}
