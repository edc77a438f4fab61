#include "repocat/fetcher.hpp"

#include <format>

#include "git_support.hpp"
#include "repocat/logger.hpp"
#include "repocat/platform.hpp"
#include "repocat/string_utils.hpp"

namespace repocat {

GitProcessFetcher::GitProcessFetcher(std::string executable)
    : executable_(std::move(executable)) {}

FetchResult GitProcessFetcher::fetch(const std::string& url,
                                     const std::filesystem::path& destination,
                                     unsigned depth) {
    const std::string command = std::format("{} clone --depth {} --single-branch --quiet {} {}",
        platform::shell_quote(executable_), depth, platform::shell_quote(url),
        platform::shell_quote(destination.string()));
    Logger::instance().debug("running {}", command);

    auto result = platform::run_command(command);
    if (!result.launched) {
        return FetchResult::failure(std::format("could not launch '{}'", executable_));
    }
    if (result.exit_code != 0) {
        auto detail = string_utils::trim(result.output);
        if (detail.empty()) {
            return FetchResult::failure(std::format("'{} clone' exited with status {}", executable_, result.exit_code));
        }
        return FetchResult::failure(
            std::format("'{} clone' exited with status {}: {}", executable_, result.exit_code, detail));
    }
    return FetchResult::success();
}

FetchResult LibGit2Fetcher::fetch(const std::string& url,
                                  const std::filesystem::path& destination,
                                  unsigned depth) {
    git::Session session;

    git_clone_options options = GIT_CLONE_OPTIONS_INIT;
    options.fetch_opts.depth = static_cast<int>(depth);

    git_repository* raw_repo = nullptr;
    const int rc = git_clone(&raw_repo, url.c_str(), destination.string().c_str(), &options);
    git::RepositoryHandle repository(raw_repo);
    if (rc != 0) {
        return FetchResult::failure(std::format("git_clone failed: {}", git::last_error_message(rc)));
    }
    return FetchResult::success();
}

} // namespace repocat
