#include <gtest/gtest.h>
#include "crypto/util/hash.hpp"
#include "merkle/Tree.hpp"
#include "TestProject.hpp"

using namespace tl::crypto::hash;
using tl::merkle::Tree;

TEST(HashTest, Blake2bIsHex256) {
    const auto h = blake2b(std::string_view("hello"));
    EXPECT_EQ(h.size(), DIGEST_HEX_CHARS);
    EXPECT_TRUE(isDigest(h));
    EXPECT_EQ(h, blake2b(std::string_view("hello")));
    EXPECT_NE(h, blake2b(std::string_view("hello!")));
}

TEST(HashTest, KnownEmptyDigest) {
    EXPECT_EQ(blake2b(std::string_view("")),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
    EXPECT_EQ(Tree::emptyHash(), blake2b(std::string_view("")));
}

TEST(HashTest, IsDigestRejectsMalformed) {
    EXPECT_FALSE(isDigest(""));
    EXPECT_FALSE(isDigest("abc"));
    EXPECT_FALSE(isDigest(std::string(DIGEST_HEX_CHARS, 'g')));
    EXPECT_FALSE(isDigest(std::string(DIGEST_HEX_CHARS, 'A')));
    EXPECT_TRUE(isDigest(std::string(DIGEST_HEX_CHARS, 'a')));
}

TEST(HashTest, HasherMatchesOneShot) {
    Hasher h;
    h.update("hel").update("lo").update('\n');
    EXPECT_EQ(h.finalHex(), blake2b(std::string_view("hello\n")));
}

class FileHashTest : public TempProjectTest {};

TEST_F(FileHashTest, FileDigestMatchesContentDigest) {
    std::string big(200000, 'x');
    big[12345] = 'y';
    writeFile("big.bin", big);
    EXPECT_EQ(blake2b(root / "big.bin"), blake2b(std::string_view(big)));
}

TEST_F(FileHashTest, MissingFileThrows) {
    EXPECT_THROW(blake2b(root / "nope"), std::runtime_error);
}

TEST(HashTest, DirectoryHashDependsOnNamesAndHashes) {
    const auto a = blake2b(std::string_view("a"));
    const auto b = blake2b(std::string_view("b"));
    const auto h1 = Tree::directoryHash({{"x", a}, {"y", b}});
    EXPECT_EQ(h1, Tree::directoryHash({{"x", a}, {"y", b}}));
    EXPECT_NE(h1, Tree::directoryHash({{"x", b}, {"y", a}}));
    EXPECT_NE(h1, Tree::directoryHash({{"x", a}, {"z", b}}));
    EXPECT_EQ(Tree::directoryHash({}), Tree::emptyHash());
}
