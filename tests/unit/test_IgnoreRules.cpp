#include <gtest/gtest.h>
#include "fs/IgnoreRules.hpp"
#include "config/Config.hpp"
#include "TestProject.hpp"

using namespace tl::fs;

TEST(IgnoreRulesTest, DefaultsAlwaysApply) {
    const IgnoreRules rules;
    EXPECT_TRUE(rules.isIgnored(".env", false));
    EXPECT_TRUE(rules.isIgnored(".git", true));
    EXPECT_TRUE(rules.isIgnored(".git/config", false));
    EXPECT_TRUE(rules.isIgnored("sub/.DS_Store", false));
    EXPECT_FALSE(rules.isIgnored("src/main.cpp", false));
}

TEST(IgnoreRulesTest, UnanchoredGlobMatchesAnyComponent) {
    const IgnoreRules rules({"*.o"});
    EXPECT_TRUE(rules.isIgnored("a.o", false));
    EXPECT_TRUE(rules.isIgnored("deep/er/b.o", false));
    EXPECT_FALSE(rules.isIgnored("a.c", false));
}

TEST(IgnoreRulesTest, TrailingSlashIsDirectoryOnly) {
    const IgnoreRules rules({"build/"});
    EXPECT_TRUE(rules.isIgnored("build", true));
    EXPECT_TRUE(rules.isIgnored("build/out.txt", false));
    EXPECT_TRUE(rules.isIgnored("x/build/y", false));
    EXPECT_FALSE(rules.isIgnored("build", false));
}

TEST(IgnoreRulesTest, PatternWithSlashIsAnchored) {
    const IgnoreRules rules({"docs/*.md"});
    EXPECT_TRUE(rules.isIgnored("docs/a.md", false));
    EXPECT_FALSE(rules.isIgnored("other/docs/a.md", false));
    EXPECT_FALSE(rules.isIgnored("docs/sub/a.md", false));
}

TEST(IgnoreRulesTest, LastMatchWinsWithNegation) {
    const IgnoreRules rules({"*.log", "!keep.log"});
    EXPECT_TRUE(rules.isIgnored("x.log", false));
    EXPECT_FALSE(rules.isIgnored("keep.log", false));
}

TEST(IgnoreRulesTest, CommentsAndBlankLinesSkipped) {
    IgnoreRules rules;
    const auto before = rules.size();
    rules.add("# comment");
    rules.add("   ");
    rules.add("");
    EXPECT_EQ(rules.size(), before);
}

class IgnoreFileTest : public TempProjectTest {};

TEST_F(IgnoreFileTest, ForProjectReadsIgnoreFile) {
    writeFile(".treelineignore", "secret/\n# note\n*.tmp\n");
    tl::config::IgnoreConfig cfg;
    cfg.patterns.clear();

    const auto rules = IgnoreRules::forProject(root, cfg);
    EXPECT_TRUE(rules.isIgnored("secret/key.pem", false));
    EXPECT_TRUE(rules.isIgnored("a.tmp", false));
    EXPECT_FALSE(rules.isIgnored("a.txt", false));
}

TEST_F(IgnoreFileTest, MissingIgnoreFileIsNotAnError) {
    tl::config::IgnoreConfig cfg;
    const auto rules = IgnoreRules::forProject(root, cfg);
    EXPECT_EQ(rules.size(), IgnoreRules::defaults().size() + cfg.patterns.size());
}
