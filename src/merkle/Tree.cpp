#include "merkle/Tree.hpp"
#include "crypto/util/hash.hpp"

#include <algorithm>

using namespace tl::merkle;

std::string_view tl::merkle::to_string(const NodeKind k) {
    return k == NodeKind::File ? "file" : "directory";
}

Tree::Tree() {
    nodes_.push_back(Node{.name = "", .kind = NodeKind::Directory, .hash = emptyHash(), .children = {}});
}

const std::string& Tree::emptyHash() {
    static const std::string h = crypto::hash::blake2b(std::string_view{});
    return h;
}

std::string Tree::directoryHash(const std::vector<std::pair<std::string_view, std::string_view>>& sortedChildren) {
    crypto::hash::Hasher h;
    for (const auto& [name, hash] : sortedChildren)
        h.update(name).update('\0').update(hash).update('\n');
    return h.finalHex();
}

size_t Tree::fileCount() const {
    return static_cast<size_t>(std::ranges::count_if(nodes_, [](const Node& n) { return n.isFile(); }));
}

std::optional<Tree::Index> Tree::find(const std::string_view path) const {
    Index cur = ROOT;
    if (path.empty()) return cur;

    size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto comp = path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);

        const auto& n = nodes_[cur];
        if (!n.isDirectory()) return std::nullopt;

        const auto it = std::ranges::lower_bound(n.children, comp, {},
                                                 [this](const Index c) -> std::string_view { return nodes_[c].name; });
        if (it == n.children.end() || nodes_[*it].name != comp) return std::nullopt;
        cur = *it;

        if (slash == std::string_view::npos) return cur;
        start = slash + 1;
    }
    return std::nullopt;
}

std::optional<std::string> Tree::leafHash(const std::string_view path) const {
    const auto i = find(path);
    if (!i || !nodes_[*i].isFile()) return std::nullopt;
    return nodes_[*i].hash;
}

std::map<std::string, std::string> Tree::leaves() const {
    std::map<std::string, std::string> out;
    collectLeaves(ROOT, "", out);
    return out;
}

void Tree::collectLeaves(const Index i, const std::string& prefix, std::map<std::string, std::string>& out) const {
    for (const auto c : nodes_[i].children) {
        const auto& child = nodes_[c];
        auto p = prefix.empty() ? child.name : prefix + '/' + child.name;
        if (child.isFile()) out.emplace(std::move(p), child.hash);
        else collectLeaves(c, p, out);
    }
}

bool tl::merkle::isValidName(const std::string_view name) {
    return !name.empty() && name != "." && name != ".."
           && name.find('/') == std::string_view::npos
           && name.find('\0') == std::string_view::npos;
}

bool tl::merkle::isValidPath(const std::string_view path) {
    if (path.empty()) return false;
    size_t start = 0;
    while (true) {
        const auto slash = path.find('/', start);
        if (!isValidName(path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start)))
            return false;
        if (slash == std::string_view::npos) return true;
        start = slash + 1;
    }
}
