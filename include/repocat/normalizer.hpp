#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace repocat {

inline constexpr std::string_view kHeaderPrefix = "*** ";

struct Block {
    std::string header;
    std::string body;
};

// Strips trailing Unicode White_Space (ASCII blanks, U+0085, U+00A0, U+1680,
// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000) from UTF-8 text.
[[nodiscard]] std::string_view trim_trailing_whitespace(std::string_view line) noexcept;

// Right-trims every line, drops lines left empty and joins the rest with a
// single '\n'. Idempotent.
[[nodiscard]] std::string normalize_text(std::string_view text);

// Offset of the first byte that is not part of a well-formed UTF-8 sequence.
[[nodiscard]] std::optional<std::size_t> find_invalid_utf8(std::string_view bytes) noexcept;

[[nodiscard]] std::string make_header(const std::filesystem::path& path);

// Reads and normalizes one file. Throws IoError when it cannot be read and
// DecodeError when it is not valid UTF-8.
[[nodiscard]] Block read_block(const std::filesystem::path& path);

} // namespace repocat
