#include "repocat/ignore_rules.hpp"

#include <fnmatch.h>

#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

#include "git_support.hpp"
#include "repocat/errors.hpp"
#include "repocat/logger.hpp"
#include "repocat/string_utils.hpp"

namespace fs = std::filesystem;

namespace repocat {
namespace {

bool glob_match(const std::string& pattern, const std::string& text, int flags) {
    return ::fnmatch(pattern.c_str(), text.c_str(), flags) == 0;
}

std::string replace_all(std::string value, std::string_view from, std::string_view to) {
    std::size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
    return value;
}

} // namespace

IgnoreFile::IgnoreFile(fs::path directory, std::string_view text)
    : directory_(std::move(directory)) {
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = string_utils::trim_right(text.substr(start, end - start));
        start = end + 1;

        if (line.empty() || line.front() == '#') {
            continue;
        }

        Rule rule;
        if (line.front() == '!') {
            rule.negated = true;
            line.remove_prefix(1);
        }
        if (!line.empty() && line.back() == '/') {
            rule.directory_only = true;
            line.remove_suffix(1);
        }
        if (!line.empty() && line.front() == '/') {
            rule.anchored = true;
            line.remove_prefix(1);
        } else if (line.starts_with("**/")) {
            line.remove_prefix(3);
        }
        if (line.find('/') != std::string_view::npos) {
            rule.anchored = true;
        }
        if (line.empty()) {
            continue;
        }
        rule.pattern.assign(line);
        rules_.push_back(std::move(rule));
    }
}

std::optional<IgnoreFile> IgnoreFile::load(const fs::path& directory, std::string_view file_name) {
    const fs::path file = directory / file_name;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw IoError(std::format("failed to open ignore file '{}'", file.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IoError(std::format("failed to read ignore file '{}'", file.string()));
    }

    IgnoreFile rules(directory, buffer.str());
    Logger::instance().debug("loaded {} rules from {}", rules.rule_count(), file.string());
    if (rules.rule_count() == 0) {
        return std::nullopt;
    }
    return rules;
}

bool IgnoreFile::rule_matches(const Rule& rule, const std::string& relative, const std::string& name) {
    if (!rule.anchored) {
        return glob_match(rule.pattern, name, 0);
    }

    if (rule.pattern.ends_with("/**")) {
        // Matches everything strictly inside the prefix directory.
        const std::string prefix = rule.pattern.substr(0, rule.pattern.size() - 3);
        fs::path ancestor;
        for (const auto& part : fs::path(relative).parent_path()) {
            ancestor /= part;
            if (glob_match(prefix, ancestor.generic_string(), FNM_PATHNAME)) {
                return true;
            }
        }
        return false;
    }

    if (glob_match(rule.pattern, relative, FNM_PATHNAME)) {
        return true;
    }
    if (rule.pattern.find("/**/") != std::string::npos) {
        // "a/**/b" spans zero or more directories.
        return glob_match(rule.pattern, relative, 0) ||
               glob_match(replace_all(rule.pattern, "/**/", "/"), relative, FNM_PATHNAME);
    }
    return false;
}

std::optional<bool> IgnoreFile::is_ignored(const fs::path& path, bool is_directory) const {
    const fs::path relative_path = path.lexically_relative(directory_);
    const std::string relative = relative_path.generic_string();
    if (relative.empty() || relative == "." || relative.starts_with("..")) {
        return std::nullopt;
    }
    const std::string name = path.filename().string();

    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (it->directory_only && !is_directory) {
            continue;
        }
        if (rule_matches(*it, relative, name)) {
            return !it->negated;
        }
    }
    return std::nullopt;
}

struct GitIgnoreIndex::Impl {
    git::Session session;
    git::RepositoryHandle repository;
    fs::path workdir;
    fs::path root;
    fs::path root_prefix;
    bool root_ignored { false };
};

GitIgnoreIndex::GitIgnoreIndex(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

GitIgnoreIndex::~GitIgnoreIndex() = default;

std::unique_ptr<GitIgnoreIndex> GitIgnoreIndex::open(const fs::path& root) {
    auto impl = std::make_unique<Impl>();
    auto& logger = Logger::instance();

    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec) {
        logger.debug("cannot resolve {}: {}", root.string(), ec.message());
        return nullptr;
    }

    git_repository* raw_repo = nullptr;
    int rc = git_repository_open_ext(&raw_repo, canonical_root.string().c_str(), 0, nullptr);
    if (rc != 0) {
        logger.debug("no git repository encloses {}", root.string());
        return nullptr;
    }
    impl->repository.reset(raw_repo);

    const char* workdir = git_repository_workdir(raw_repo);
    if (workdir == nullptr) {
        logger.debug("repository enclosing {} is bare, skipping git ignore rules", root.string());
        return nullptr;
    }

    std::string workdir_text = workdir;
    while (workdir_text.size() > 1 && workdir_text.back() == '/') {
        workdir_text.pop_back();
    }
    impl->workdir = fs::weakly_canonical(fs::path(workdir_text), ec);
    if (ec) {
        impl->workdir = fs::path(workdir_text);
        ec.clear();
    }
    impl->root = root;
    impl->root_prefix = canonical_root.lexically_relative(impl->workdir);
    if (impl->root_prefix == ".") {
        impl->root_prefix.clear();
    }

    if (!impl->root_prefix.empty()) {
        const std::string root_dir = impl->root_prefix.generic_string() + "/";
        int ignored = 0;
        rc = git_ignore_path_is_ignored(&ignored, impl->repository.get(), root_dir.c_str());
        if (rc != 0) {
            logger.warn("git ignore lookup failed for {}: {}", root_dir, git::last_error_message(rc));
        } else if (ignored != 0) {
            logger.debug("{} is ignored by the repository at {}", root.string(), impl->workdir.string());
            impl->root_ignored = true;
        }
    }
    logger.debug("honoring git ignore rules of repository at {}", impl->workdir.string());
    return std::unique_ptr<GitIgnoreIndex>(new GitIgnoreIndex(std::move(impl)));
}

bool GitIgnoreIndex::is_ignored(const fs::path& path, bool is_directory) const {
    if (impl_->root_ignored) {
        return false;
    }
    std::string relative = (impl_->root_prefix / path.lexically_relative(impl_->root)).generic_string();
    if (relative.empty() || relative == ".") {
        return false;
    }
    if (is_directory) {
        relative.push_back('/');
    }

    int ignored = 0;
    int rc = git_ignore_path_is_ignored(&ignored, impl_->repository.get(), relative.c_str());
    if (rc != 0) {
        Logger::instance().warn("git ignore lookup failed for {}: {}", relative, git::last_error_message(rc));
        return false;
    }
    return ignored != 0;
}

bool GitIgnoreIndex::root_ignored() const noexcept {
    return impl_->root_ignored;
}

const fs::path& GitIgnoreIndex::workdir() const noexcept {
    return impl_->workdir;
}

} // namespace repocat
