#include "merkle/Differ.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace tl::merkle;

static std::string join(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + '/' + name;
}

ChangeSet Differ::diff(const Tree& previous, const Tree& current, DiffStats* stats) {
    Differ d(previous, current);
    d.compare(Tree::ROOT, Tree::ROOT, "");

    log::Registry::merkle()->debug("[Differ] {} -> {}: +{} ~{} -{} ({} nodes visited)",
                                   previous.rootHash(), current.rootHash(), d.out_.added.size(),
                                   d.out_.modified.size(), d.out_.removed.size(), d.stats_.nodesVisited);

    if (stats) *stats = d.stats_;
    return std::move(d.out_);
}

void Differ::collect(const Tree& t, const Tree::Index i, const std::string& path, std::set<std::string>& into) {
    ++stats_.nodesVisited;
    const auto& n = t.node(i);
    if (n.isFile()) {
        into.insert(path);
        return;
    }
    for (const auto c : n.children) collect(t, c, join(path, t.node(c).name), into);
}

void Differ::compare(const Tree::Index p, const Tree::Index c, const std::string& path) {
    ++stats_.nodesVisited;
    const auto& pn = prev_.node(p);
    const auto& cn = cur_.node(c);

    if (pn.hash == cn.hash && pn.kind == cn.kind) return;

    if (pn.isFile() && cn.isFile()) {
        out_.modified.insert(path);
        return;
    }

    if (pn.kind != cn.kind) {
        collect(prev_, p, path, out_.removed);
        collect(cur_, c, path, out_.added);
        return;
    }

    // both directories: merge children by name
    auto pi = pn.children.begin();
    auto ci = cn.children.begin();
    while (pi != pn.children.end() || ci != cn.children.end()) {
        if (ci == cn.children.end() || (pi != pn.children.end() && prev_.node(*pi).name < cur_.node(*ci).name)) {
            collect(prev_, *pi, join(path, prev_.node(*pi).name), out_.removed);
            ++pi;
        } else if (pi == pn.children.end() || cur_.node(*ci).name < prev_.node(*pi).name) {
            collect(cur_, *ci, join(path, cur_.node(*ci).name), out_.added);
            ++ci;
        } else {
            compare(*pi, *ci, join(path, cur_.node(*ci).name));
            ++pi;
            ++ci;
        }
    }
}

void tl::merkle::to_json(nlohmann::json& j, const ChangeSet& c) {
    j = {
        {"added", c.added},
        {"modified", c.modified},
        {"removed", c.removed}
    };
}

void tl::merkle::from_json(const nlohmann::json& j, ChangeSet& c) {
    c.added = j.value("added", std::set<std::string>{});
    c.modified = j.value("modified", std::set<std::string>{});
    c.removed = j.value("removed", std::set<std::string>{});
}
