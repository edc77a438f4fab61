#include <gtest/gtest.h>

#include "repocat/errors.hpp"
#include "repocat/glob.hpp"

using namespace repocat;

TEST(GlobPattern, MatchesAgainstWholePath) {
    const auto pattern = GlobPattern::compile("*.py");
    EXPECT_TRUE(pattern.matches("a.py"));
    EXPECT_TRUE(pattern.matches("/tmp/work/src/a.py"));
    EXPECT_TRUE(pattern.matches("./pkg/.hidden.py"));
    EXPECT_FALSE(pattern.matches("/tmp/work/a.pyc"));
    EXPECT_FALSE(pattern.matches("/tmp/work/a.PY"));
}

TEST(GlobPattern, StarCrossesDirectorySeparators) {
    const auto pattern = GlobPattern::compile("*/tests/*");
    EXPECT_TRUE(pattern.matches("/repo/tests/unit/a.rs"));
    EXPECT_FALSE(pattern.matches("/repo/src/a.rs"));
}

TEST(GlobPattern, SupportsCharacterClasses) {
    const auto positive = GlobPattern::compile("*/[ab].md");
    EXPECT_TRUE(positive.matches("/r/a.md"));
    EXPECT_FALSE(positive.matches("/r/c.md"));

    const auto negative = GlobPattern::compile("*/[!ab].md");
    EXPECT_TRUE(negative.matches("/r/c.md"));
    EXPECT_FALSE(negative.matches("/r/a.md"));

    const auto bracket_member = GlobPattern::compile("*[]]*");
    EXPECT_TRUE(bracket_member.matches("x]y"));
}

TEST(GlobPattern, AcceptsRecursiveWildcardAsComponent) {
    EXPECT_NO_THROW((void)GlobPattern::compile("**/*.rs"));
    EXPECT_NO_THROW((void)GlobPattern::compile("src/**/mod.rs"));
    EXPECT_NO_THROW((void)GlobPattern::compile("vendor/**"));
    EXPECT_TRUE(GlobPattern::compile("**/*.rs").matches("/abs/src/lib.rs"));
}

TEST(GlobPattern, RejectsMalformedSyntax) {
    EXPECT_THROW((void)GlobPattern::compile("[abc"), ConfigError);
    EXPECT_THROW((void)GlobPattern::compile("*.[ch"), ConfigError);
    EXPECT_THROW((void)GlobPattern::compile("a**b"), ConfigError);
    EXPECT_THROW((void)GlobPattern::compile("***/x"), ConfigError);
    EXPECT_THROW((void)GlobPattern::compile("src/**.rs"), ConfigError);
}

TEST(GlobPattern, MatchesAnyOverList) {
    const auto patterns = compile_patterns({"*.py", "*.md"});
    EXPECT_TRUE(matches_any(patterns, "/r/readme.md"));
    EXPECT_FALSE(matches_any(patterns, "/r/main.rs"));
    EXPECT_FALSE(matches_any({}, "/r/main.rs"));
}
