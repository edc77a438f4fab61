#include "repocat/glob.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <format>

#include "repocat/errors.hpp"

namespace repocat {
namespace {

void validate_brackets(std::string_view pattern) {
    std::size_t i = 0;
    while (i < pattern.size()) {
        if (pattern[i] != '[') {
            ++i;
            continue;
        }
        std::size_t j = i + 1;
        if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
            ++j;
        }
        // A leading ']' is a literal member of the class.
        if (j < pattern.size() && pattern[j] == ']') {
            ++j;
        }
        auto close = pattern.find(']', j);
        if (close == std::string_view::npos) {
            throw ConfigError(std::format("invalid glob '{}': unclosed '[' at offset {}", pattern, i));
        }
        i = close + 1;
    }
}

void validate_recursive_wildcards(std::string_view pattern) {
    std::size_t pos = pattern.find("**");
    while (pos != std::string_view::npos) {
        std::size_t end = pos;
        while (end < pattern.size() && pattern[end] == '*') {
            ++end;
        }
        const bool starts_component = pos == 0 || pattern[pos - 1] == '/';
        const bool ends_component = end == pattern.size() || pattern[end] == '/';
        if (end - pos != 2 || !starts_component || !ends_component) {
            throw ConfigError(std::format(
                "invalid glob '{}': '**' must form a complete path component", pattern));
        }
        pos = pattern.find("**", end);
    }
}

} // namespace

GlobPattern GlobPattern::compile(std::string pattern) {
    validate_brackets(pattern);
    validate_recursive_wildcards(pattern);
    return GlobPattern(std::move(pattern));
}

bool GlobPattern::matches(const std::string& path) const {
    return ::fnmatch(pattern_.c_str(), path.c_str(), FNM_NOESCAPE) == 0;
}

std::vector<GlobPattern> compile_patterns(const std::vector<std::string>& patterns) {
    std::vector<GlobPattern> compiled;
    compiled.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        compiled.push_back(GlobPattern::compile(pattern));
    }
    return compiled;
}

bool matches_any(const std::vector<GlobPattern>& patterns, const std::string& path) {
    return std::any_of(patterns.begin(), patterns.end(),
        [&](const GlobPattern& pattern) { return pattern.matches(path); });
}

} // namespace repocat
