#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "repocat/cli.hpp"
#include "repocat/config.hpp"
#include "repocat/errors.hpp"
#include "repocat/logger.hpp"
#include "test_support.hpp"

using namespace repocat;

namespace {

struct Argv {
    explicit Argv(std::vector<std::string> args)
        : storage(std::move(args)) {
        storage.insert(storage.begin(), "repocat");
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
        pointers.push_back(nullptr);
    }

    [[nodiscard]] int argc() const { return static_cast<int>(storage.size()); }
    [[nodiscard]] char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

std::optional<int> parse(std::vector<std::string> args, RunOptions& options) {
    Argv argv(std::move(args));
    Cli cli;
    return cli.parse(argv.argc(), argv.argv(), options);
}

} // namespace

TEST(Cli, InputAloneUsesDefaults) {
    RunOptions options;
    EXPECT_FALSE(parse({"-i", "./project"}, options).has_value());
    EXPECT_EQ(options.input, "./project");
    EXPECT_EQ(options.output, std::filesystem::path(std::string{kDefaultOutputFile}));
    EXPECT_EQ(options.selection.mode, SelectionConfig::Mode::Glob);
    EXPECT_EQ(options.selection.include_patterns, default_include_patterns());
    EXPECT_TRUE(options.walk.skip_hidden);
    EXPECT_TRUE(options.walk.honor_ignore_files);
}

TEST(Cli, ParsesGlobListsAndWalkFlags) {
    RunOptions options;
    EXPECT_FALSE(parse({"--input", "https://github.com/a/b", "--output", "out.txt", "--include", "*.py, *.rs",
                        "--exclude", "*/tests/*", "--hidden", "--no-ignore"},
        options).has_value());
    EXPECT_EQ(options.input, "https://github.com/a/b");
    EXPECT_EQ(options.output, std::filesystem::path("out.txt"));
    EXPECT_EQ(options.selection.include_patterns, (std::vector<std::string>{"*.py", "*.rs"}));
    EXPECT_EQ(options.selection.exclude_patterns, (std::vector<std::string>{"*/tests/*"}));
    EXPECT_FALSE(options.walk.skip_hidden);
    EXPECT_FALSE(options.walk.honor_ignore_files);
}

TEST(Cli, ConfigSelectsExtensionMode) {
    test::ScratchDir dir;
    const auto config = dir.write("exts.json", R"({"file_extensions": ["py", "toml"]})");

    RunOptions options;
    EXPECT_FALSE(parse({"-i", ".", "-c", config.string()}, options).has_value());
    EXPECT_EQ(options.selection.mode, SelectionConfig::Mode::Extension);
    EXPECT_EQ(options.selection.extensions, (std::set<std::string>{"py", "toml"}));
}

TEST(Cli, ConfigAndGlobsAreExclusive) {
    test::ScratchDir dir;
    const auto config = dir.write("exts.json", R"({"file_extensions": ["py"]})");

    RunOptions options;
    EXPECT_THROW((void)parse({"-i", ".", "-c", config.string(), "--include", "*.py"}, options), ConfigError);
}

TEST(Cli, InvalidConfigContentIsConfigError) {
    test::ScratchDir dir;
    const auto config = dir.write("exts.json", R"({"file_extensions": [".py"]})");

    RunOptions options;
    EXPECT_THROW((void)parse({"-i", ".", "-c", config.string()}, options), ConfigError);
}

TEST(Cli, BadGlobIsConfigError) {
    RunOptions options;
    EXPECT_THROW((void)parse({"-i", ".", "--include", "[abc"}, options), ConfigError);
}

TEST(Cli, MissingInputIsAUsageError) {
    RunOptions options;
    const auto code = parse({"-o", "out.txt"}, options);
    ASSERT_TRUE(code.has_value());
    EXPECT_NE(*code, 0);
}

TEST(Cli, MissingConfigFileIsAUsageError) {
    RunOptions options;
    const auto code = parse({"-i", ".", "-c", "/nonexistent/repocat.json"}, options);
    ASSERT_TRUE(code.has_value());
    EXPECT_NE(*code, 0);
}

TEST(Cli, VersionExitsCleanly) {
    RunOptions options;
    const auto code = parse({"--version"}, options);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
}

TEST(Cli, LogLevelIsApplied) {
    RunOptions options;
    EXPECT_FALSE(parse({"-i", ".", "-v", "debug"}, options).has_value());
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);

    EXPECT_THROW((void)parse({"-i", ".", "--log-level", "chatty"}, options), ConfigError);

    Logger::instance().set_level(LogLevel::Error);
}
