#pragma once

#include "fileweave/config/schema.hpp"

#include <cstdint>
#include <string_view>

namespace fileweave::io {

inline constexpr std::uint64_t SMALL_FILE_THRESHOLD = 1024ULL * 1024ULL;
inline constexpr std::uint64_t MEDIUM_FILE_THRESHOLD = 16ULL * 1024ULL * 1024ULL;
inline constexpr std::uint64_t STREAM_CHUNK_SIZE = 8ULL * 1024ULL * 1024ULL;

enum class FileSizeClass { Small, Medium, Large };

// Half-open ranges: [0, small) is Small, [small, medium) is Medium, the rest
// is Large.
struct SizeThresholds {
  std::uint64_t small_threshold = SMALL_FILE_THRESHOLD;
  std::uint64_t medium_threshold = MEDIUM_FILE_THRESHOLD;
  std::uint64_t stream_chunk_size = STREAM_CHUNK_SIZE;

  [[nodiscard]] FileSizeClass classify(std::uint64_t size) const;
  [[nodiscard]] bool valid() const;
};

[[nodiscard]] SizeThresholds thresholds_from_config(const config::IoConfig &io);
[[nodiscard]] FileSizeClass size_class_from_size(std::uint64_t size);
[[nodiscard]] std::string_view size_class_to_string(FileSizeClass size_class);

} // namespace fileweave::io
