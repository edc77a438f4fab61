#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace repocat::platform {

struct CommandResult {
    bool launched { false };
    int exit_code { -1 };
    std::string output;
};

[[nodiscard]] std::string shell_quote(std::string_view value);

// Runs `command` through the shell with stderr folded into the captured output.
[[nodiscard]] CommandResult run_command(const std::string& command);

// Creates a fresh directory named `<prefix>XXXXXX` under the system temp
// directory. Throws std::system_error on failure.
[[nodiscard]] std::filesystem::path make_temp_directory(std::string_view prefix);

} // namespace repocat::platform
