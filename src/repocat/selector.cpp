#include "repocat/selector.hpp"

#include <algorithm>
#include <format>
#include <system_error>

#include "repocat/errors.hpp"
#include "repocat/logger.hpp"
#include "repocat/string_utils.hpp"

namespace fs = std::filesystem;

namespace repocat {

SelectionPredicate::SelectionPredicate(const SelectionConfig& config)
    : mode_(config.mode) {
    if (mode_ == SelectionConfig::Mode::Glob) {
        include_ = compile_patterns(config.include_patterns);
        exclude_ = compile_patterns(config.exclude_patterns);
    } else {
        extensions_ = config.extensions;
    }
}

bool SelectionPredicate::selects(const fs::path& path) const {
    if (mode_ == SelectionConfig::Mode::Extension) {
        const std::string extension = path.extension().string();
        // "." alone means the name ends with a dot and has no extension.
        if (extension.size() <= 1) {
            return false;
        }
        return extensions_.contains(extension.substr(1));
    }

    const std::string text = path.string();
    if (matches_any(exclude_, text)) {
        return false;
    }
    return matches_any(include_, text);
}

FileSelector::FileSelector(fs::path root, SelectionPredicate predicate, WalkOptions options)
    : root_(std::move(root))
    , predicate_(std::move(predicate))
    , options_(options) {}

FileSelector::~FileSelector() = default;

void FileSelector::skip_file(const fs::path& path) {
    skipped_files_.push_back(path);
}

void FileSelector::push_directory(const fs::path& directory) {
    Frame frame;
    frame.directory = directory;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw IoError(std::format("failed to read directory '{}': {}", directory.string(), ec.message()));
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        frame.entries.push_back(*it);
    }
    if (ec) {
        throw IoError(std::format("failed to read directory '{}': {}", directory.string(), ec.message()));
    }

    std::sort(frame.entries.begin(), frame.entries.end(),
        [](const fs::directory_entry& lhs, const fs::directory_entry& rhs) {
            return lhs.path().filename().native() < rhs.path().filename().native();
        });

    if (options_.honor_ignore_files) {
        frame.ignore = IgnoreFile::load(directory);
        if (read_gitignore_files_) {
            frame.gitignore = IgnoreFile::load(directory, kGitIgnoreFileName);
        }
    }
    stack_.push_back(std::move(frame));
}

void FileSelector::start() {
    if (options_.honor_ignore_files) {
        git_ignore_ = GitIgnoreIndex::open(root_);
        read_gitignore_files_ = git_ignore_ && git_ignore_->root_ignored();

        std::error_code ec;
        absolute_root_ = fs::weakly_canonical(fs::absolute(root_, ec), ec);
        if (ec) {
            Logger::instance().debug("cannot resolve {}: {}", root_.string(), ec.message());
            absolute_root_.clear();
        } else {
            load_parent_rules();
        }
    }
    push_directory(root_);
}

void FileSelector::load_parent_rules() {
    if (absolute_root_ == absolute_root_.root_path()) {
        return;
    }
    // .gitignore files above the root only matter up to the working tree.
    bool in_worktree = read_gitignore_files_;
    for (fs::path dir = absolute_root_.parent_path(); !dir.empty(); dir = dir.parent_path()) {
        if (auto rules = IgnoreFile::load(dir)) {
            parent_ignores_.push_back(std::move(*rules));
        }
        if (in_worktree) {
            if (auto rules = IgnoreFile::load(dir, kGitIgnoreFileName)) {
                parent_gitignores_.push_back(std::move(*rules));
            }
            in_worktree = dir != git_ignore_->workdir();
        }
        if (dir == dir.root_path()) {
            break;
        }
    }
}

fs::path FileSelector::absolute_path(const fs::path& path) const {
    return absolute_root_ / path.lexically_relative(root_);
}

bool FileSelector::is_ignored(const fs::path& path, bool is_directory) const {
    if (!options_.honor_ignore_files) {
        return false;
    }

    // Deeper files override shallower ones, and .ignore overrides .gitignore.
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
        if (!it->ignore) {
            continue;
        }
        if (auto decision = it->ignore->is_ignored(path, is_directory)) {
            return *decision;
        }
    }
    if (!parent_ignores_.empty()) {
        const fs::path absolute = absolute_path(path);
        for (const auto& rules : parent_ignores_) {
            if (auto decision = rules.is_ignored(absolute, is_directory)) {
                return *decision;
            }
        }
    }

    if (read_gitignore_files_) {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
            if (!it->gitignore) {
                continue;
            }
            if (auto decision = it->gitignore->is_ignored(path, is_directory)) {
                return *decision;
            }
        }
        const fs::path absolute = absolute_path(path);
        for (const auto& rules : parent_gitignores_) {
            if (auto decision = rules.is_ignored(absolute, is_directory)) {
                return *decision;
            }
        }
        return false;
    }
    return git_ignore_ && git_ignore_->is_ignored(path, is_directory);
}

bool FileSelector::is_skipped_file(const fs::path& path) const {
    for (const auto& skipped : skipped_files_) {
        std::error_code ec;
        if (fs::equivalent(path, skipped, ec) && !ec) {
            return true;
        }
    }
    return false;
}

std::optional<fs::path> FileSelector::next() {
    auto& logger = Logger::instance();

    if (!started_) {
        started_ = true;
        start();
    }

    while (!stack_.empty()) {
        Frame& frame = stack_.back();
        if (frame.index >= frame.entries.size()) {
            stack_.pop_back();
            continue;
        }
        // Copied out: push_directory() may reallocate the stack.
        const fs::directory_entry entry = frame.entries[frame.index++];
        const fs::path& path = entry.path();
        const std::string name = path.filename().string();

        std::error_code ec;
        const fs::file_status link_status = entry.symlink_status(ec);
        if (ec) {
            throw IoError(std::format("failed to stat '{}': {}", path.string(), ec.message()));
        }

        if (fs::is_directory(link_status)) {
            if (name == ".git" || (options_.skip_hidden && string_utils::is_hidden(name))) {
                logger.trace("skipping hidden directory {}", path.string());
                continue;
            }
            if (is_ignored(path, true)) {
                logger.trace("skipping ignored directory {}", path.string());
                continue;
            }
            push_directory(path);
            continue;
        }

        bool regular = fs::is_regular_file(link_status);
        if (fs::is_symlink(link_status)) {
            // Symlinked files are read through; symlinked directories are not descended.
            regular = fs::is_regular_file(entry.status(ec)) && !ec;
        }
        if (!regular) {
            logger.trace("skipping non-regular entry {}", path.string());
            continue;
        }

        if (options_.skip_hidden && string_utils::is_hidden(name)) {
            continue;
        }
        if (is_ignored(path, false)) {
            logger.trace("skipping ignored file {}", path.string());
            continue;
        }
        if (is_skipped_file(path)) {
            logger.debug("skipping {}", path.string());
            continue;
        }

        ++visited_files_;
        if (predicate_.selects(path)) {
            return path;
        }
    }
    return std::nullopt;
}

} // namespace repocat
