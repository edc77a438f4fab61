#pragma once

#include <git2.h>

#include <memory>
#include <string>

namespace repocat::git {

// libgit2 reference-counts init/shutdown, so sessions may nest.
class Session {
public:
    Session() { git_libgit2_init(); }
    ~Session() { git_libgit2_shutdown(); }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
};

struct RepositoryDeleter {
    void operator()(git_repository* repo) const noexcept { git_repository_free(repo); }
};

using RepositoryHandle = std::unique_ptr<git_repository, RepositoryDeleter>;

inline std::string last_error_message(int code) {
    const git_error* error = git_error_last();
    if (error != nullptr && error->message != nullptr) {
        return error->message;
    }
    return "libgit2 error " + std::to_string(code);
}

} // namespace repocat::git
