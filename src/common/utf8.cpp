#include "fileweave/common/utf8.hpp"

#include <algorithm>
#include <iterator>

namespace fileweave::common {

namespace {

bool is_continuation(const unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

// Length of the well-formed sequence starting at `pos`, or 0 when malformed.
std::size_t sequence_length(std::string_view text, const std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  const std::size_t remaining = text.size() - pos;

  if (lead < 0x80U) {
    return 1;
  }

  auto at = [&](std::size_t i) { return static_cast<unsigned char>(text[pos + i]); };

  if (lead >= 0xC2U && lead <= 0xDFU) {
    return remaining >= 2 && is_continuation(at(1)) ? 2 : 0;
  }

  if (lead >= 0xE0U && lead <= 0xEFU) {
    if (remaining < 3 || !is_continuation(at(1)) || !is_continuation(at(2))) {
      return 0;
    }
    if (lead == 0xE0U && at(1) < 0xA0U) {
      return 0;
    }
    if (lead == 0xEDU && at(1) > 0x9FU) {
      return 0;
    }
    return 3;
  }

  if (lead >= 0xF0U && lead <= 0xF4U) {
    if (remaining < 4 || !is_continuation(at(1)) || !is_continuation(at(2)) ||
        !is_continuation(at(3))) {
      return 0;
    }
    if (lead == 0xF0U && at(1) < 0x90U) {
      return 0;
    }
    if (lead == 0xF4U && at(1) > 0x8FU) {
      return 0;
    }
    return 4;
  }

  return 0;
}

} // namespace

std::optional<std::size_t> find_invalid_utf8(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t len = sequence_length(text, pos);
    if (len == 0) {
      return pos;
    }
    pos += len;
  }
  return std::nullopt;
}

bool is_valid_utf8(std::string_view text) { return !find_invalid_utf8(text).has_value(); }

bool is_char_boundary(std::string_view text, const std::size_t offset) {
  if (offset == 0 || offset == text.size()) {
    return true;
  }
  if (offset > text.size()) {
    return false;
  }
  return !is_continuation(static_cast<unsigned char>(text[offset]));
}

std::size_t floor_char_boundary(std::string_view text, std::size_t offset) {
  if (offset >= text.size()) {
    return text.size();
  }
  while (offset > 0 && !is_char_boundary(text, offset)) {
    --offset;
  }
  return offset;
}

std::size_t ceil_char_boundary(std::string_view text, std::size_t offset) {
  if (offset >= text.size()) {
    return text.size();
  }
  while (offset < text.size() && !is_char_boundary(text, offset)) {
    ++offset;
  }
  return offset;
}

std::vector<std::size_t> char_boundaries(std::string_view text) {
  std::vector<std::size_t> boundaries;
  boundaries.reserve(text.size() + 1);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (!is_continuation(static_cast<unsigned char>(text[i]))) {
      boundaries.push_back(i);
    }
  }
  boundaries.push_back(text.size());
  return boundaries;
}

std::size_t char_count(std::string_view text) {
  return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
    return !is_continuation(static_cast<unsigned char>(c));
  }));
}

std::size_t char_index_of(const std::vector<std::size_t> &boundaries,
                          const std::size_t byte_offset) {
  const auto it = std::lower_bound(boundaries.begin(), boundaries.end(), byte_offset);
  return static_cast<std::size_t>(std::distance(boundaries.begin(), it));
}

} // namespace fileweave::common
