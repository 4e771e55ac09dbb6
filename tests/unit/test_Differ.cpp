#include <gtest/gtest.h>
#include "merkle/Builder.hpp"
#include "merkle/Differ.hpp"
#include "crypto/util/hash.hpp"

#include <nlohmann/json.hpp>

using namespace tl::merkle;
using tl::crypto::hash::blake2b;

namespace {

using Leaves = std::map<std::string, std::string>;

std::string h(const std::string& s) { return blake2b(std::string_view(s)); }

Tree tree(const std::map<std::string, std::string>& contents) {
    Leaves leaves;
    for (const auto& [p, c] : contents) leaves[p] = h(c);
    return Builder::fromLeaves(leaves);
}

}

TEST(DifferTest, IdenticalTreesYieldEmptyChangeSet) {
    const auto t = tree({{"a.txt", "a"}, {"d/b.txt", "b"}});
    DiffStats stats;
    EXPECT_TRUE(Differ::diff(t, t, &stats).empty());
    EXPECT_EQ(stats.nodesVisited, 1u);
}

TEST(DifferTest, EmptyPreviousMeansEverythingAdded) {
    const auto cs = Differ::diff(Tree{}, tree({{"d/a.txt", "hello"}, {"d/b.txt", "world"}}));
    EXPECT_EQ(cs.added, (std::set<std::string>{"d/a.txt", "d/b.txt"}));
    EXPECT_TRUE(cs.modified.empty());
    EXPECT_TRUE(cs.removed.empty());
}

TEST(DifferTest, ModifiedAddedRemoved) {
    const auto prev = tree({{"a.txt", "a"}, {"d/b.txt", "b"}, {"d/c.txt", "c"}});
    const auto cur = tree({{"a.txt", "a"}, {"d/b.txt", "b2"}, {"e/new.txt", "n"}});

    const auto cs = Differ::diff(prev, cur);
    EXPECT_EQ(cs.modified, (std::set<std::string>{"d/b.txt"}));
    EXPECT_EQ(cs.added, (std::set<std::string>{"e/new.txt"}));
    EXPECT_EQ(cs.removed, (std::set<std::string>{"d/c.txt"}));
}

TEST(DifferTest, RenameIsRemoveAndAdd) {
    const auto cs = Differ::diff(tree({{"old.txt", "same"}}), tree({{"new.txt", "same"}}));
    EXPECT_EQ(cs.removed, (std::set<std::string>{"old.txt"}));
    EXPECT_EQ(cs.added, (std::set<std::string>{"new.txt"}));
    EXPECT_TRUE(cs.modified.empty());
}

TEST(DifferTest, FileReplacedByDirectory) {
    const auto cs = Differ::diff(tree({{"x", "file"}}), tree({{"x/a", "1"}, {"x/b", "2"}}));
    EXPECT_EQ(cs.removed, (std::set<std::string>{"x"}));
    EXPECT_EQ(cs.added, (std::set<std::string>{"x/a", "x/b"}));
}

TEST(DifferTest, UnchangedSubtreesArePruned) {
    std::map<std::string, std::string> contents;
    for (int d = 0; d < 10; ++d)
        for (int f = 0; f < 10; ++f)
            contents["dir" + std::to_string(d) + "/f" + std::to_string(f)] = std::to_string(d * 100 + f);

    const auto prev = tree(contents);
    contents["dir3/f7"] = "changed";
    const auto cur = tree(contents);

    DiffStats stats;
    const auto cs = Differ::diff(prev, cur, &stats);
    EXPECT_EQ(cs.modified, (std::set<std::string>{"dir3/f7"}));

    // root, the ten top-level directories, then the ten files of dir3
    EXPECT_EQ(stats.nodesVisited, 1u + 10u + 10u);
    EXPECT_LT(stats.nodesVisited, prev.nodeCount());
}

TEST(DifferTest, ChangeSetJsonShape) {
    ChangeSet cs;
    cs.added = {"a"};
    cs.removed = {"r"};
    const nlohmann::json j = cs;
    EXPECT_EQ(j.at("added"), nlohmann::json::array({"a"}));
    EXPECT_TRUE(j.at("modified").empty());
    EXPECT_EQ(j.get<ChangeSet>(), cs);
}
