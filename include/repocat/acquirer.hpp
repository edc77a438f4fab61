#pragma once

#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "repocat/fetcher.hpp"

namespace repocat {

inline constexpr std::array<std::string_view, 3> kRemoteHosts = {
    "https://github.com",
    "https://gitlab.com",
    "https://bitbucket.org",
};

[[nodiscard]] bool is_remote_input(std::string_view input) noexcept;

// Uniquely named directory under the system temp directory, removed with its
// contents on destruction.
class TempDirectory {
public:
    // Throws AcquisitionError when the directory cannot be created.
    [[nodiscard]] static TempDirectory create(std::string_view prefix = "repocat-");

    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    ~TempDirectory();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Removes everything inside the directory, keeping the directory itself.
    void clear();

private:
    explicit TempDirectory(std::filesystem::path path)
        : path_(std::move(path)) {}

    void release() noexcept;

    std::filesystem::path path_;
};

// The local root a run walks. Owns the temporary checkout for remote inputs.
class AcquiredSource {
public:
    explicit AcquiredSource(std::filesystem::path root)
        : root_(std::move(root)) {}
    explicit AcquiredSource(TempDirectory checkout)
        : root_(checkout.path())
        , checkout_(std::move(checkout)) {}

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] bool is_remote() const noexcept { return checkout_.has_value(); }

private:
    std::filesystem::path root_;
    std::optional<TempDirectory> checkout_;
};

class SourceAcquirer {
public:
    // Fetchers are tried in order; the first success wins.
    explicit SourceAcquirer(std::vector<std::unique_ptr<Fetcher>> fetchers, unsigned depth = kShallowDepth);

    // git subprocess first, libgit2 second.
    [[nodiscard]] static SourceAcquirer with_default_fetchers();

    // Throws AcquisitionError.
    [[nodiscard]] AcquiredSource acquire(const std::string& input);

private:
    [[nodiscard]] AcquiredSource acquire_local(const std::string& input) const;
    [[nodiscard]] AcquiredSource acquire_remote(const std::string& url);

    std::vector<std::unique_ptr<Fetcher>> fetchers_;
    unsigned depth_;
};

} // namespace repocat
