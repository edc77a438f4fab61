#include "repocat/platform.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <system_error>
#include <vector>

namespace repocat::platform {

namespace {
using popen_handle = std::unique_ptr<FILE, decltype(&pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(::popen(command.c_str(), "r"), pclose);
}
} // namespace

std::string shell_quote(std::string_view value) {
    std::string result = "'";
    for (char ch : value) {
        if (ch == '\'') {
            result += "'\\''";
        } else {
            result += ch;
        }
    }
    result += "'";
    return result;
}

CommandResult run_command(const std::string& command) {
    CommandResult result;
    const std::string full_command = command + " 2>&1";

    popen_handle pipe = make_pipe(full_command);
    if (!pipe) {
        return result;
    }
    result.launched = true;

    std::array<char, 4096> buffer{};
    while (true) {
        std::size_t bytes = std::fread(buffer.data(), 1, buffer.size(), pipe.get());
        if (bytes == 0) {
            break;
        }
        result.output.append(buffer.data(), bytes);
    }

    // Released so the wait status from pclose() can be read.
    const int status = ::pclose(pipe.release());
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

std::filesystem::path make_temp_directory(std::string_view prefix) {
    std::string pattern = (std::filesystem::temp_directory_path() / prefix).string();
    pattern += "XXXXXX";

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp " + pattern);
    }
    return std::filesystem::path(buffer.data());
}

} // namespace repocat::platform
