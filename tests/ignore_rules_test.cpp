#include <gtest/gtest.h>

#include <git2.h>

#include <filesystem>
#include <vector>

#include "repocat/config.hpp"
#include "repocat/ignore_rules.hpp"
#include "repocat/selector.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace repocat;

namespace {

std::vector<fs::path> select_all(const fs::path& root, WalkOptions options = {}) {
    SelectionConfig config;
    config.include_patterns = {"*"};
    FileSelector selector(root, SelectionPredicate(config), options);
    std::vector<fs::path> paths;
    while (auto path = selector.next()) {
        paths.push_back(*path);
    }
    return paths;
}

void init_repository(const fs::path& root) {
    git_libgit2_init();
    git_repository* repo = nullptr;
    ASSERT_EQ(git_repository_init(&repo, root.string().c_str(), 0), 0);
    git_repository_free(repo);
    git_libgit2_shutdown();
}

} // namespace

TEST(IgnoreFile, MatchesBasenamesAtAnyDepth) {
    IgnoreFile rules("/r", "# comment\n\n*.log\n");
    EXPECT_EQ(rules.rule_count(), 1u);
    EXPECT_EQ(rules.is_ignored("/r/app.log", false), true);
    EXPECT_EQ(rules.is_ignored("/r/deep/nested/app.log", false), true);
    EXPECT_FALSE(rules.is_ignored("/r/app.py", false).has_value());
}

TEST(IgnoreFile, LastMatchingRuleWins) {
    IgnoreFile rules("/r", "*.log\n!keep.log\n");
    EXPECT_EQ(rules.is_ignored("/r/drop.log", false), true);
    EXPECT_EQ(rules.is_ignored("/r/keep.log", false), false);
}

TEST(IgnoreFile, DirectoryOnlyRules) {
    IgnoreFile rules("/r", "build/\n");
    EXPECT_EQ(rules.is_ignored("/r/build", true), true);
    EXPECT_FALSE(rules.is_ignored("/r/build", false).has_value());
}

TEST(IgnoreFile, SlashAnchorsToTheFileDirectory) {
    IgnoreFile rules("/r", "/top.txt\ndocs/*.md\ngen/**\n**/cache\n");
    EXPECT_EQ(rules.is_ignored("/r/top.txt", false), true);
    EXPECT_FALSE(rules.is_ignored("/r/sub/top.txt", false).has_value());
    EXPECT_EQ(rules.is_ignored("/r/docs/a.md", false), true);
    EXPECT_FALSE(rules.is_ignored("/r/docs/deep/a.md", false).has_value());
    EXPECT_FALSE(rules.is_ignored("/r/other/docs/a.md", false).has_value());
    EXPECT_EQ(rules.is_ignored("/r/gen/x/y.c", false), true);
    EXPECT_EQ(rules.is_ignored("/r/a/b/cache", true), true);
}

TEST(IgnoreFile, IgnoresPathsOutsideItsDirectory) {
    IgnoreFile rules("/r/sub", "*.py\n");
    EXPECT_FALSE(rules.is_ignored("/r/a.py", false).has_value());
    EXPECT_EQ(rules.is_ignored("/r/sub/a.py", false), true);
}

TEST(IgnoreFile, LoadReturnsNothingWithoutAFile) {
    test::ScratchDir dir;
    EXPECT_FALSE(IgnoreFile::load(dir.path()).has_value());

    dir.write(".ignore", "# only comments\n");
    EXPECT_FALSE(IgnoreFile::load(dir.path()).has_value());
}

TEST(IgnoreWalk, DotIgnoreFilesApplyWithoutRepository) {
    test::ScratchDir dir;
    dir.write(".ignore", "generated/\n*.tmp\n");
    dir.write("keep.py", "k");
    dir.write("scratch.tmp", "s");
    dir.write("generated/out.py", "g");
    dir.write("sub/.ignore", "!*.tmp\nlocal.py\n");
    dir.write("sub/kept.tmp", "t");
    dir.write("sub/local.py", "l");

    const auto root = dir.path();
    EXPECT_EQ(select_all(root), (std::vector<fs::path>{
        root / "keep.py",
        root / "sub" / "kept.tmp",
    }));
}

TEST(IgnoreWalk, GitignoreNeedsARepository) {
    test::ScratchDir dir;
    dir.write(".gitignore", "ignored.py\n");
    dir.write("ignored.py", "i");
    dir.write("kept.py", "k");

    const auto root = dir.path();
    EXPECT_EQ(select_all(root).size(), 2u);

    init_repository(root);
    EXPECT_EQ(select_all(root), (std::vector<fs::path>{root / "kept.py"}));
}

TEST(IgnoreWalk, GitignoreChainInSubdirectories) {
    test::ScratchDir dir;
    const auto root = dir.path();
    init_repository(root);
    dir.write(".gitignore", "out/\n");
    dir.write("out/artifact.py", "a");
    dir.write("src/.gitignore", "*.gen.py\n");
    dir.write("src/main.py", "m");
    dir.write("src/table.gen.py", "t");

    EXPECT_EQ(select_all(root), (std::vector<fs::path>{root / "src" / "main.py"}));

    // Walking a subdirectory still sees the repository's rules.
    EXPECT_EQ(select_all(root / "src"), (std::vector<fs::path>{root / "src" / "main.py"}));
}

TEST(IgnoreWalk, NoIgnoreDisablesAllIgnoreFiles) {
    test::ScratchDir dir;
    const auto root = dir.path();
    init_repository(root);
    dir.write(".gitignore", "a.py\n");
    dir.write(".ignore", "b.py\n");
    dir.write("a.py", "a");
    dir.write("b.py", "b");

    WalkOptions options;
    options.honor_ignore_files = false;
    EXPECT_EQ(select_all(root, options), (std::vector<fs::path>{root / "a.py", root / "b.py"}));
}

TEST(IgnoreWalk, RootInsideIgnoredDirectoryIsStillWalked) {
    test::ScratchDir dir;
    const auto root = dir.path();
    init_repository(root);
    dir.write(".gitignore", "build/\n*.tmp\n");
    dir.write("build/x.py", "x");
    dir.write("build/scratch.tmp", "t");
    dir.write("build/.gitignore", "gen.py\n");
    dir.write("build/gen.py", "g");
    dir.write("build/sub/y.py", "y");
    dir.write("kept.py", "k");

    // Walking the repository skips the ignored directory entirely.
    EXPECT_EQ(select_all(root), (std::vector<fs::path>{root / "kept.py"}));

    // Walking the ignored directory itself only applies rules to entries below it.
    const auto build = root / "build";
    EXPECT_EQ(select_all(build), (std::vector<fs::path>{build / "sub" / "y.py", build / "x.py"}));
}

TEST(IgnoreWalk, DotIgnoreFilesAboveTheRootApply) {
    test::ScratchDir dir;
    dir.write(".ignore", "*.log\nproject/\n");
    dir.write("project/.ignore", "!keep.log\n");
    dir.write("project/a.py", "a");
    dir.write("project/drop.log", "d");
    dir.write("project/keep.log", "k");
    dir.write("project/nested/deep.log", "n");

    // The root is never filtered, even when a parent rule names it.
    const auto project = dir.path() / "project";
    EXPECT_EQ(select_all(project), (std::vector<fs::path>{project / "a.py", project / "keep.log"}));

    WalkOptions options;
    options.honor_ignore_files = false;
    EXPECT_EQ(select_all(project, options).size(), 4u);
}
