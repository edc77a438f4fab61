#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace repocat {

inline constexpr std::string_view kDefaultOutputFile = "concatenated_output.txt";

struct SelectionConfig {
    enum class Mode {
        Glob,
        Extension,
    };

    Mode mode { Mode::Glob };

    // Glob mode.
    std::vector<std::string> include_patterns {};
    std::vector<std::string> exclude_patterns {};

    // Extension mode: bare extensions without the leading dot.
    std::set<std::string> extensions {};
};

struct WalkOptions {
    bool skip_hidden { true };
    bool honor_ignore_files { true };
};

struct RunOptions {
    std::string input {};
    std::filesystem::path output { std::string{kDefaultOutputFile} };
    SelectionConfig selection {};
    WalkOptions walk {};
};

[[nodiscard]] std::vector<std::string> default_include_patterns();

// Glob mode with the default include set and no excludes.
[[nodiscard]] SelectionConfig default_selection();

// Glob mode from comma-delimited lists; an empty include list falls back to
// the default include set. Throws ConfigError on malformed globs.
[[nodiscard]] SelectionConfig glob_selection(std::string_view include_list, std::string_view exclude_list);

// Extension mode from a JSON document of the form {"file_extensions": [...]}.
[[nodiscard]] SelectionConfig parse_extension_config(std::string_view json_text);
[[nodiscard]] SelectionConfig load_extension_config(const std::filesystem::path& path);

} // namespace repocat
