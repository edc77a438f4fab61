#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace repocat {

// Shell-style wildcard evaluated against a whole path string. `*` and `?`
// also match `/`; `**` is accepted only as a complete path component.
class GlobPattern {
public:
    // Throws ConfigError on malformed syntax.
    [[nodiscard]] static GlobPattern compile(std::string pattern);

    [[nodiscard]] bool matches(const std::string& path) const;

private:
    explicit GlobPattern(std::string pattern)
        : pattern_(std::move(pattern)) {}

    std::string pattern_;
};

[[nodiscard]] std::vector<GlobPattern> compile_patterns(const std::vector<std::string>& patterns);

[[nodiscard]] bool matches_any(const std::vector<GlobPattern>& patterns, const std::string& path);

} // namespace repocat
