#include <gtest/gtest.h>
#include "merkle/Builder.hpp"
#include "merkle/Tree.hpp"
#include "fs/Enumerator.hpp"
#include "crypto/util/hash.hpp"
#include "util/errors.hpp"
#include "TestProject.hpp"

#include <algorithm>
#include <random>

using namespace tl::merkle;
using tl::fs::model::FileRecord;
using tl::crypto::hash::blake2b;

namespace {

FileRecord rec(const std::string& path, const std::string& content) {
    return {path, blake2b(std::string_view(content)), content.size(), 0};
}

std::vector<FileRecord> sampleRecords() {
    return {
        rec("README.md", "readme"),
        rec("src/main.cpp", "int main() {}"),
        rec("src/util/strings.cpp", "strings"),
        rec("src/util/strings.hpp", "header"),
        rec("tests/test_main.cpp", "tests"),
        rec("z.txt", "last"),
    };
}

std::string hashAt(const Tree& t, const std::string& path) {
    const auto i = t.find(path);
    return i ? t.node(*i).hash : std::string{};
}

}

TEST(MerkleTreeTest, EmptyTreeHashesEmptyString) {
    const Tree t;
    EXPECT_TRUE(t.empty());
    EXPECT_EQ(t.rootHash(), blake2b(std::string_view("")));
    EXPECT_EQ(Builder::fromRecords({}).rootHash(), t.rootHash());
}

TEST(MerkleTreeTest, PermutationDoesNotChangeRootHash) {
    auto records = sampleRecords();
    const auto expected = Builder::fromRecords(records).rootHash();

    std::mt19937 rng(42);
    for (int i = 0; i < 20; ++i) {
        std::ranges::shuffle(records, rng);
        EXPECT_EQ(Builder::fromRecords(records).rootHash(), expected);
    }
}

TEST(MerkleTreeTest, SingleLeafChangeTouchesOnlyAncestorChain) {
    const auto before = Builder::fromRecords(sampleRecords());

    auto records = sampleRecords();
    for (auto& r : records)
        if (r.path == "src/util/strings.cpp") r = rec(r.path, "strings v2");
    const auto after = Builder::fromRecords(records);

    for (const auto* changed : {"src/util/strings.cpp", "src/util", "src"})
        EXPECT_NE(hashAt(before, changed), hashAt(after, changed)) << changed;
    EXPECT_NE(before.rootHash(), after.rootHash());

    for (const auto* same : {"src/util/strings.hpp", "src/main.cpp", "tests", "tests/test_main.cpp", "README.md", "z.txt"})
        EXPECT_EQ(hashAt(before, same), hashAt(after, same)) << same;
}

TEST(MerkleTreeTest, DirectoryHashIsOverSortedChildren) {
    const auto t = Builder::fromRecords(sampleRecords());
    const auto& util = t.node(*t.find("src/util"));
    ASSERT_EQ(util.children.size(), 2u);
    EXPECT_EQ(t.node(util.children[0]).name, "strings.cpp");
    EXPECT_EQ(t.node(util.children[1]).name, "strings.hpp");
    EXPECT_EQ(util.hash, Tree::directoryHash({{"strings.cpp", blake2b(std::string_view("strings"))},
                                              {"strings.hpp", blake2b(std::string_view("header"))}}));
}

TEST(MerkleTreeTest, LeavesAndLookup) {
    const auto t = Builder::fromRecords(sampleRecords());
    EXPECT_EQ(t.fileCount(), 6u);
    EXPECT_EQ(t.leaves().size(), 6u);
    EXPECT_EQ(t.leafHash("src/main.cpp"), blake2b(std::string_view("int main() {}")));
    EXPECT_FALSE(t.leafHash("src").has_value());
    EXPECT_FALSE(t.leafHash("nope.txt").has_value());
    EXPECT_FALSE(t.find("src/nope").has_value());
}

TEST(MerkleTreeTest, FromLeavesRejectsCollisionsAndBadPaths) {
    EXPECT_THROW(Builder::fromLeaves({{"a", blake2b(std::string_view("x"))}, {"a/b", blake2b(std::string_view("y"))}}),
                 tl::SnapshotError);
    EXPECT_THROW(Builder::fromLeaves({{"../escape", blake2b(std::string_view("x"))}}), tl::SnapshotError);
    EXPECT_THROW(Builder::fromLeaves({{"a//b", blake2b(std::string_view("x"))}}), tl::SnapshotError);
    EXPECT_THROW(Builder::fromLeaves({{"a", "not-a-digest"}}), tl::SnapshotError);
}

TEST(MerkleTreeTest, PathValidation) {
    EXPECT_TRUE(isValidPath("a/b.txt"));
    EXPECT_FALSE(isValidPath(""));
    EXPECT_FALSE(isValidPath("/abs"));
    EXPECT_FALSE(isValidPath("a/./b"));
    EXPECT_FALSE(isValidPath("a/"));
    EXPECT_TRUE(isValidName("x.y"));
    EXPECT_FALSE(isValidName(".."));
    EXPECT_FALSE(isValidName("a/b"));
}

class MerkleBuildTest : public TempProjectTest {};

TEST_F(MerkleBuildTest, BuildFromDiskMatchesRecords) {
    writeFile("d/a.txt", "hello");
    writeFile("d/b.txt", "world");
    fs::create_directories(root / "empty");

    const auto built = Builder::build(root, tl::fs::Enumerator(tl::fs::IgnoreRules{}));
    EXPECT_EQ(built.records.size(), 2u);
    EXPECT_EQ(built.tree.rootHash(), Builder::fromRecords({rec("d/b.txt", "world"), rec("d/a.txt", "hello")}).rootHash());
    EXPECT_FALSE(built.tree.find("empty").has_value());
}
