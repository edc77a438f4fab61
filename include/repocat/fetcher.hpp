#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace repocat {

inline constexpr unsigned kShallowDepth = 1;

struct FetchResult {
    bool ok { false };
    std::string message;

    [[nodiscard]] static FetchResult success() { return {true, {}}; }
    [[nodiscard]] static FetchResult failure(std::string message) { return {false, std::move(message)}; }

    explicit operator bool() const noexcept { return ok; }
};

// One clone strategy. Failures are reported through the result, never thrown.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // Clones `url` into the existing, empty `destination` with history
    // truncated to `depth` commits.
    [[nodiscard]] virtual FetchResult fetch(const std::string& url,
                                            const std::filesystem::path& destination,
                                            unsigned depth) = 0;
};

// Shells out to `git clone --depth N --single-branch`.
class GitProcessFetcher : public Fetcher {
public:
    explicit GitProcessFetcher(std::string executable = "git");

    [[nodiscard]] std::string_view name() const noexcept override { return "git subprocess"; }
    [[nodiscard]] FetchResult fetch(const std::string& url,
                                    const std::filesystem::path& destination,
                                    unsigned depth) override;

private:
    std::string executable_;
};

// In-process clone through libgit2.
class LibGit2Fetcher : public Fetcher {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "libgit2"; }
    [[nodiscard]] FetchResult fetch(const std::string& url,
                                    const std::filesystem::path& destination,
                                    unsigned depth) override;
};

} // namespace repocat
