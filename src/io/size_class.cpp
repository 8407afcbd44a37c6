#include "fileweave/io/size_class.hpp"

namespace fileweave::io {

FileSizeClass SizeThresholds::classify(const std::uint64_t size) const {
  if (size < small_threshold) {
    return FileSizeClass::Small;
  }
  if (size < medium_threshold) {
    return FileSizeClass::Medium;
  }
  return FileSizeClass::Large;
}

bool SizeThresholds::valid() const {
  return small_threshold > 0 && small_threshold < medium_threshold && stream_chunk_size > 0;
}

SizeThresholds thresholds_from_config(const config::IoConfig &io) {
  return SizeThresholds{
      .small_threshold = io.small_file_threshold,
      .medium_threshold = io.medium_file_threshold,
      .stream_chunk_size = io.stream_chunk_size,
  };
}

FileSizeClass size_class_from_size(const std::uint64_t size) {
  return SizeThresholds{}.classify(size);
}

std::string_view size_class_to_string(const FileSizeClass size_class) {
  switch (size_class) {
  case FileSizeClass::Small:
    return "small";
  case FileSizeClass::Medium:
    return "medium";
  case FileSizeClass::Large:
    return "large";
  }
  return "small";
}

} // namespace fileweave::io
