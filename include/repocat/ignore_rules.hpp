#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace repocat {

inline constexpr std::string_view kIgnoreFileName = ".ignore";
inline constexpr std::string_view kGitIgnoreFileName = ".gitignore";

// Rules of one gitignore-syntax file, scoped to the directory holding it.
class IgnoreFile {
public:
    IgnoreFile(std::filesystem::path directory, std::string_view text);

    // Returns nullopt when no rule in the file applies. Throws IoError when
    // the file exists but cannot be read.
    [[nodiscard]] static std::optional<IgnoreFile> load(const std::filesystem::path& directory,
                                                        std::string_view file_name = kIgnoreFileName);

    // Last matching rule wins; nullopt when nothing matches.
    [[nodiscard]] std::optional<bool> is_ignored(const std::filesystem::path& path, bool is_directory) const;

    [[nodiscard]] std::size_t rule_count() const noexcept { return rules_.size(); }

private:
    struct Rule {
        std::string pattern;
        bool negated { false };
        bool directory_only { false };
        bool anchored { false };
    };

    [[nodiscard]] static bool rule_matches(const Rule& rule, const std::string& relative, const std::string& name);

    std::filesystem::path directory_;
    std::vector<Rule> rules_;
};

// The git ignore chain (.gitignore files, info/exclude, core.excludesFile)
// of the repository enclosing a walk root, evaluated by libgit2.
class GitIgnoreIndex {
public:
    // nullptr when `root` is not inside a repository with a working tree.
    [[nodiscard]] static std::unique_ptr<GitIgnoreIndex> open(const std::filesystem::path& root);

    ~GitIgnoreIndex();

    GitIgnoreIndex(const GitIgnoreIndex&) = delete;
    GitIgnoreIndex& operator=(const GitIgnoreIndex&) = delete;

    // `path` must lie under the root passed to open(). Always false when the
    // root itself is ignored, since libgit2 would then report every entry.
    [[nodiscard]] bool is_ignored(const std::filesystem::path& path, bool is_directory) const;

    // True when the root lies in a directory the repository ignores. The
    // caller then has to evaluate .gitignore files itself.
    [[nodiscard]] bool root_ignored() const noexcept;

    // Canonical working tree path, without a trailing separator.
    [[nodiscard]] const std::filesystem::path& workdir() const noexcept;

private:
    struct Impl;
    explicit GitIgnoreIndex(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace repocat
