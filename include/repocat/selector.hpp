#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "repocat/config.hpp"
#include "repocat/glob.hpp"
#include "repocat/ignore_rules.hpp"

namespace repocat {

// Pure decision of whether a walked path belongs in the output.
class SelectionPredicate {
public:
    // Throws ConfigError when a glob pattern is malformed.
    explicit SelectionPredicate(const SelectionConfig& config);

    [[nodiscard]] bool selects(const std::filesystem::path& path) const;

private:
    SelectionConfig::Mode mode_;
    std::vector<GlobPattern> include_;
    std::vector<GlobPattern> exclude_;
    std::set<std::string> extensions_;
};

// Depth-first walk of a root directory yielding selected regular files one at
// a time. Entries of a directory are visited in ascending filename order.
class FileSelector {
public:
    FileSelector(std::filesystem::path root, SelectionPredicate predicate, WalkOptions options = {});
    ~FileSelector();

    FileSelector(const FileSelector&) = delete;
    FileSelector& operator=(const FileSelector&) = delete;

    // Never yield `path`, whatever the rules say.
    void skip_file(const std::filesystem::path& path);

    // Next selected path, or nullopt once the walk is exhausted. Throws
    // IoError when a directory cannot be read.
    [[nodiscard]] std::optional<std::filesystem::path> next();

    [[nodiscard]] std::size_t visited_files() const noexcept { return visited_files_; }

private:
    struct Frame {
        std::filesystem::path directory;
        std::vector<std::filesystem::directory_entry> entries;
        std::size_t index { 0 };
        std::optional<IgnoreFile> ignore;
        std::optional<IgnoreFile> gitignore;
    };

    void start();
    void load_parent_rules();
    void push_directory(const std::filesystem::path& directory);
    [[nodiscard]] bool is_ignored(const std::filesystem::path& path, bool is_directory) const;
    [[nodiscard]] bool is_skipped_file(const std::filesystem::path& path) const;
    [[nodiscard]] std::filesystem::path absolute_path(const std::filesystem::path& path) const;

    std::filesystem::path root_;
    std::filesystem::path absolute_root_;
    SelectionPredicate predicate_;
    WalkOptions options_;
    std::vector<Frame> stack_;
    std::unique_ptr<GitIgnoreIndex> git_ignore_;
    // Rules found above the root, nearest directory first.
    std::vector<IgnoreFile> parent_ignores_;
    std::vector<IgnoreFile> parent_gitignores_;
    // Set when the root lies in an ignored directory of its repository.
    bool read_gitignore_files_ { false };
    std::vector<std::filesystem::path> skipped_files_;
    std::size_t visited_files_ { 0 };
    bool started_ { false };
};

} // namespace repocat
