#include <gtest/gtest.h>
#include "fs/Enumerator.hpp"
#include "fs/Project.hpp"
#include "concurrency/ThreadPool.hpp"
#include "crypto/util/hash.hpp"
#include "util/errors.hpp"
#include "TestProject.hpp"

#include <unistd.h>

using namespace tl::fs;

class EnumeratorTest : public TempProjectTest {
protected:
    static std::vector<std::string> paths(const EnumerationResult& r) {
        std::vector<std::string> out;
        for (const auto& rec : r.records) out.push_back(rec.path);
        return out;
    }
};

TEST_F(EnumeratorTest, ListsFilesSortedWithHashes) {
    writeFile("b.txt", "world");
    writeFile("a.txt", "hello");
    writeFile("d/c.txt", "nested");

    const Enumerator e(IgnoreRules{});
    const auto r = e.enumerate(root);

    EXPECT_EQ(paths(r), (std::vector<std::string>{"a.txt", "b.txt", "d/c.txt"}));
    EXPECT_TRUE(r.rejects.empty());
    EXPECT_EQ(r.records[0].contentHash, tl::crypto::hash::blake2b(std::string_view("hello")));
    EXPECT_EQ(r.records[0].size, 5u);
}

TEST_F(EnumeratorTest, SkipsIgnoredPathsAndSymlinks) {
    writeFile("keep.txt", "k");
    writeFile(".env", "SECRET=1");
    writeFile("build/out.o", "bin");
    writeFile(".git/HEAD", "ref");
    fs::create_symlink(root / "keep.txt", root / "link.txt");

    const Enumerator e(IgnoreRules({"build/"}));
    EXPECT_EQ(paths(e.enumerate(root)), (std::vector<std::string>{"keep.txt"}));
}

TEST_F(EnumeratorTest, EmptyDirectoriesContributeNothing) {
    fs::create_directories(root / "empty/deeper");
    writeFile("x.txt", "x");

    const Enumerator e(IgnoreRules{});
    EXPECT_EQ(paths(e.enumerate(root)), (std::vector<std::string>{"x.txt"}));
}

TEST_F(EnumeratorTest, PoolAndSerialAgree) {
    for (int i = 0; i < 40; ++i) writeFile("dir" + std::to_string(i % 4) + "/f" + std::to_string(i), std::to_string(i * i));

    const auto pool = std::make_shared<tl::concurrency::ThreadPool>(4);
    const auto serial = Enumerator(IgnoreRules{}).enumerate(root);
    const auto pooled = Enumerator(IgnoreRules{}, pool).enumerate(root);
    pool->stop();

    ASSERT_EQ(serial.records.size(), 40u);
    ASSERT_EQ(serial.records.size(), pooled.records.size());
    for (size_t i = 0; i < serial.records.size(); ++i) {
        EXPECT_EQ(serial.records[i].path, pooled.records[i].path);
        EXPECT_EQ(serial.records[i].contentHash, pooled.records[i].contentHash);
    }
}

TEST_F(EnumeratorTest, MissingRootThrows) {
    const Enumerator e(IgnoreRules{});
    EXPECT_THROW((void)e.enumerate(root / "missing"), tl::EnumerationError);
}

TEST_F(EnumeratorTest, FileRootThrows) {
    writeFile("file.txt", "x");
    const Enumerator e(IgnoreRules{});
    EXPECT_THROW((void)e.enumerate(root / "file.txt"), tl::EnumerationError);
}

TEST_F(EnumeratorTest, UnreadableSubdirectoryIsRejectedNotFatal) {
    if (::geteuid() == 0) GTEST_SKIP() << "permission bits do not restrict root";

    writeFile("ok.txt", "ok");
    writeFile("locked/secret.txt", "s");
    fs::permissions(root / "locked", fs::perms::none);

    const auto r = Enumerator(IgnoreRules{}).enumerate(root);
    fs::permissions(root / "locked", fs::perms::owner_all);

    EXPECT_EQ(paths(r), (std::vector<std::string>{"ok.txt"}));
    ASSERT_EQ(r.rejects.size(), 1u);
    EXPECT_EQ(r.rejects[0].path, "locked");
}

TEST_F(EnumeratorTest, DetectsProjectRootFromMarker) {
    writeFile("pyproject.toml", "[project]");
    fs::create_directories(root / "src/pkg");

    const auto detected = detectProjectRoot(root / "src/pkg");
    EXPECT_EQ(detected.string(), fs::weakly_canonical(root).string());
    EXPECT_EQ(defaultProjectId(root / "src/.."), fs::weakly_canonical(root).string());
}
