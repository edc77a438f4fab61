#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace repocat::string_utils {

[[nodiscard]] constexpr bool is_ascii_space(char ch) noexcept {
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\v' || ch == '\f';
}

[[nodiscard]] inline std::string_view trim_right(std::string_view value) noexcept {
    while (!value.empty() && is_ascii_space(value.back())) {
        value.remove_suffix(1);
    }
    return value;
}

[[nodiscard]] inline std::string_view trim(std::string_view value) noexcept {
    while (!value.empty() && is_ascii_space(value.front())) {
        value.remove_prefix(1);
    }
    return trim_right(value);
}

// Splits a comma-delimited list, trimming items and dropping empty ones.
[[nodiscard]] inline std::vector<std::string> split_list(std::string_view text, char delimiter = ',') {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find(delimiter, start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto item = trim(text.substr(start, end - start));
        if (!item.empty()) {
            items.emplace_back(item);
        }
        start = end + 1;
    }
    return items;
}

[[nodiscard]] inline bool is_hidden(std::string_view name) noexcept {
    return !name.empty() && name.front() == '.';
}

} // namespace repocat::string_utils
