#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace fileweave::common {

// Offset of the first byte that does not start a well-formed UTF-8 sequence
// (overlong forms, surrogates and values above U+10FFFF are rejected).
[[nodiscard]] std::optional<std::size_t> find_invalid_utf8(std::string_view text);
[[nodiscard]] bool is_valid_utf8(std::string_view text);

// The boundary helpers below assume `text` is valid UTF-8.
[[nodiscard]] bool is_char_boundary(std::string_view text, std::size_t offset);
[[nodiscard]] std::size_t floor_char_boundary(std::string_view text, std::size_t offset);
[[nodiscard]] std::size_t ceil_char_boundary(std::string_view text, std::size_t offset);

// Byte offset of every codepoint start, followed by text.size().
[[nodiscard]] std::vector<std::size_t> char_boundaries(std::string_view text);
[[nodiscard]] std::size_t char_count(std::string_view text);

// Codepoint index of `byte_offset` within a table from char_boundaries().
[[nodiscard]] std::size_t char_index_of(const std::vector<std::size_t> &boundaries,
                                        std::size_t byte_offset);

} // namespace fileweave::common
