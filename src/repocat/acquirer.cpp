#include "repocat/acquirer.hpp"

#include <format>
#include <system_error>
#include <utility>
#include <vector>

#include "repocat/errors.hpp"
#include "repocat/logger.hpp"
#include "repocat/perf.hpp"
#include "repocat/platform.hpp"

namespace fs = std::filesystem;

namespace repocat {

bool is_remote_input(std::string_view input) noexcept {
    for (auto host : kRemoteHosts) {
        if (input.starts_with(host) && (input.size() == host.size() || input[host.size()] == '/')) {
            return true;
        }
    }
    return false;
}

TempDirectory TempDirectory::create(std::string_view prefix) {
    try {
        return TempDirectory(platform::make_temp_directory(prefix));
    } catch (const std::system_error& e) {
        throw AcquisitionError(std::format("failed to create temporary directory: {}", e.what()));
    }
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

TempDirectory::~TempDirectory() {
    release();
}

void TempDirectory::clear() {
    std::error_code ec;
    std::vector<fs::path> children;
    for (fs::directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        throw AcquisitionError(std::format("failed to clear '{}': {}", path_.string(), ec.message()));
    }
    for (const auto& child : children) {
        fs::remove_all(child, ec);
        if (ec) {
            throw AcquisitionError(std::format("failed to clear '{}': {}", child.string(), ec.message()));
        }
    }
}

void TempDirectory::release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        Logger::instance().warn("failed to remove temporary directory {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

SourceAcquirer::SourceAcquirer(std::vector<std::unique_ptr<Fetcher>> fetchers, unsigned depth)
    : fetchers_(std::move(fetchers))
    , depth_(depth) {}

SourceAcquirer SourceAcquirer::with_default_fetchers() {
    std::vector<std::unique_ptr<Fetcher>> fetchers;
    fetchers.push_back(std::make_unique<GitProcessFetcher>());
    fetchers.push_back(std::make_unique<LibGit2Fetcher>());
    return SourceAcquirer(std::move(fetchers));
}

AcquiredSource SourceAcquirer::acquire(const std::string& input) {
    if (is_remote_input(input)) {
        return acquire_remote(input);
    }
    return acquire_local(input);
}

AcquiredSource SourceAcquirer::acquire_local(const std::string& input) const {
    const fs::path root(input);
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        throw AcquisitionError(std::format("input path '{}' does not exist", input));
    }
    if (!fs::is_directory(root, ec)) {
        throw AcquisitionError(std::format("input path '{}' is not a directory", input));
    }
    fs::directory_iterator readable(root, ec);
    if (ec) {
        throw AcquisitionError(std::format("input path '{}' is not readable: {}", input, ec.message()));
    }
    return AcquiredSource(root);
}

AcquiredSource SourceAcquirer::acquire_remote(const std::string& url) {
    auto& logger = Logger::instance();
    ScopedTimer timer(std::format("clone {}", url));

    auto checkout = TempDirectory::create();
    logger.info("cloning {} into {}", url, checkout.path().string());

    std::string failures;
    bool first = true;
    for (auto& fetcher : fetchers_) {
        if (!first) {
            // A failed attempt may leave a partial checkout behind.
            checkout.clear();
        }
        first = false;

        logger.debug("trying {} (depth {})", fetcher->name(), depth_);
        FetchResult result = fetcher->fetch(url, checkout.path(), depth_);
        if (result) {
            logger.info("cloned {} with {}", url, fetcher->name());
            return AcquiredSource(std::move(checkout));
        }

        logger.warn("{} clone of {} failed: {}", fetcher->name(), url, result.message);
        if (!failures.empty()) {
            failures += "; ";
        }
        failures += std::format("{}: {}", fetcher->name(), result.message);
    }

    if (failures.empty()) {
        failures = "no clone strategy configured";
    }
    throw AcquisitionError(std::format("failed to clone '{}' ({})", url, failures));
}

} // namespace repocat
