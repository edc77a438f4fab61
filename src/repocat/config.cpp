#include "repocat/config.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <sstream>

#include "repocat/errors.hpp"
#include "repocat/glob.hpp"
#include "repocat/logger.hpp"
#include "repocat/string_utils.hpp"

namespace repocat {

using json = nlohmann::json;

std::vector<std::string> default_include_patterns() {
    return {
        "*.py", "*.rs", "*.md", "*.toml", "*.txt", "*.c", "*.h", "*.cpp", "*.hpp", "*.cc", "*.hh",
        "*.cxx", "*.rst", "*.go", "*.java", "*.js", "*.ts", "*.sh", "*.cmake", "*.json", "*.yaml",
        "*.yml",
    };
}

SelectionConfig default_selection() {
    SelectionConfig config;
    config.mode = SelectionConfig::Mode::Glob;
    config.include_patterns = default_include_patterns();
    return config;
}

SelectionConfig glob_selection(std::string_view include_list, std::string_view exclude_list) {
    SelectionConfig config;
    config.mode = SelectionConfig::Mode::Glob;
    config.include_patterns = string_utils::split_list(include_list);
    config.exclude_patterns = string_utils::split_list(exclude_list);
    if (config.include_patterns.empty()) {
        config.include_patterns = default_include_patterns();
    }

    // Surface syntax errors at configuration time rather than mid-walk.
    (void)compile_patterns(config.include_patterns);
    (void)compile_patterns(config.exclude_patterns);
    return config;
}

SelectionConfig parse_extension_config(std::string_view json_text) {
    json document;
    try {
        document = json::parse(json_text.begin(), json_text.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::format("failed to parse config: {}", e.what()));
    }

    if (!document.is_object()) {
        throw ConfigError("config must be a JSON object");
    }
    auto it = document.find("file_extensions");
    if (it == document.end()) {
        throw ConfigError("config is missing required key 'file_extensions'");
    }
    if (!it->is_array()) {
        throw ConfigError("'file_extensions' must be an array of strings");
    }

    SelectionConfig config;
    config.mode = SelectionConfig::Mode::Extension;
    for (const auto& value : *it) {
        if (!value.is_string()) {
            throw ConfigError("'file_extensions' must be an array of strings");
        }
        auto extension = value.get<std::string>();
        if (extension.empty()) {
            continue;
        }
        if (extension.front() == '.') {
            throw ConfigError(std::format("extension '{}' must be given without a leading dot", extension));
        }
        config.extensions.insert(std::move(extension));
    }
    Logger::instance().debug("extension allowlist holds {} entries", config.extensions.size());
    return config;
}

SelectionConfig load_extension_config(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError(std::format("failed to read config file '{}'", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IoError(std::format("failed to read config file '{}'", path.string()));
    }

    try {
        return parse_extension_config(buffer.str());
    } catch (const Error& e) {
        e.rethrow_with_context(std::format("config file '{}'", path.string()));
    }
}

} // namespace repocat
