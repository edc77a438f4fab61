#include "repocat/normalizer.hpp"

#include <cstdint>
#include <format>
#include <fstream>
#include <sstream>

#include "repocat/errors.hpp"
#include "repocat/string_utils.hpp"

namespace repocat {
namespace {

// Byte length of the Unicode White_Space character that ends `text`, or 0.
std::size_t trailing_space_length(std::string_view text) noexcept {
    if (text.empty()) {
        return 0;
    }
    if (string_utils::is_ascii_space(text.back())) {
        return 1;
    }

    const auto byte = [&](std::size_t from_end) {
        return static_cast<std::uint8_t>(text[text.size() - from_end]);
    };
    if (text.size() >= 2 && byte(2) == 0xC2 && (byte(1) == 0x85 || byte(1) == 0xA0)) {
        return 2; // U+0085, U+00A0
    }
    if (text.size() < 3) {
        return 0;
    }
    const std::uint32_t codepoint =
        (static_cast<std::uint32_t>(byte(3)) << 16) | (static_cast<std::uint32_t>(byte(2)) << 8) | byte(1);
    switch (codepoint) {
    case 0xE19A80: // U+1680
    case 0xE280A8: // U+2028
    case 0xE280A9: // U+2029
    case 0xE280AF: // U+202F
    case 0xE2819F: // U+205F
    case 0xE38080: // U+3000
        return 3;
    default:
        break;
    }
    // U+2000..U+200A
    if (codepoint >= 0xE28080 && codepoint <= 0xE2808A) {
        return 3;
    }
    return 0;
}

} // namespace

std::string_view trim_trailing_whitespace(std::string_view line) noexcept {
    while (auto length = trailing_space_length(line)) {
        line.remove_suffix(length);
    }
    return line;
}

std::string normalize_text(std::string_view text) {
    std::string body;
    body.reserve(text.size());

    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = trim_trailing_whitespace(text.substr(start, end - start));
        if (!line.empty()) {
            if (!body.empty()) {
                body.push_back('\n');
            }
            body.append(line);
        }
        start = end + 1;
    }
    return body;
}

std::optional<std::size_t> find_invalid_utf8(std::string_view bytes) noexcept {
    std::size_t i = 0;
    const std::size_t size = bytes.size();
    while (i < size) {
        const auto lead = static_cast<std::uint8_t>(bytes[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        std::uint32_t codepoint = 0;
        std::uint32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codepoint = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codepoint = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codepoint = lead & 0x07;
            minimum = 0x10000;
        } else {
            return i;
        }

        if (size - i < length) {
            return i;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto next = static_cast<std::uint8_t>(bytes[i + k]);
            if ((next & 0xC0) != 0x80) {
                return i;
            }
            codepoint = (codepoint << 6) | (next & 0x3F);
        }

        if (codepoint < minimum || codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return i;
        }
        i += length;
    }
    return std::nullopt;
}

std::string make_header(const std::filesystem::path& path) {
    std::string header{kHeaderPrefix};
    header += path.string();
    return header;
}

Block read_block(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError(std::format("failed to open '{}'", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IoError(std::format("failed to read '{}'", path.string()));
    }
    const std::string contents = buffer.str();

    if (auto offset = find_invalid_utf8(contents)) {
        throw DecodeError(std::format("'{}' is not valid UTF-8 (invalid byte at offset {})", path.string(), *offset));
    }

    return Block{make_header(path), normalize_text(contents)};
}

} // namespace repocat
