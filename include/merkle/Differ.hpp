#pragma once

#include "merkle/ChangeSet.hpp"
#include "merkle/Tree.hpp"

#include <string>

namespace tl::merkle {

struct DiffStats {
    size_t nodesVisited = 0;
};

class Differ {
public:
    // Subtrees with equal hashes at the same path are pruned without descending.
    static ChangeSet diff(const Tree& previous, const Tree& current, DiffStats* stats = nullptr);

private:
    const Tree& prev_;
    const Tree& cur_;
    ChangeSet out_;
    DiffStats stats_;

    Differ(const Tree& prev, const Tree& cur) : prev_(prev), cur_(cur) {}

    void compare(Tree::Index p, Tree::Index c, const std::string& path);
    void collect(const Tree& t, Tree::Index i, const std::string& path, std::set<std::string>& into);
};

}
