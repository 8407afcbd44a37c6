#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fileweave::config {

struct IoConfig {
  std::uint64_t small_file_threshold = 1024ULL * 1024ULL;
  std::uint64_t medium_file_threshold = 16ULL * 1024ULL * 1024ULL;
  std::uint64_t stream_chunk_size = 8ULL * 1024ULL * 1024ULL;
  std::uint64_t max_file_size = 100ULL * 1024ULL * 1024ULL;
};

struct SecuritySettings {
  std::string base_dir;
  bool allow_hidden = false;
  bool follow_symlinks = true;
  std::optional<std::size_t> max_depth;
  std::vector<std::string> denied_patterns;
};

struct ChunkingSettings {
  std::size_t max_chunk_size = 2000;
  std::size_t overlap_size = 200;
  std::string strategy = "sentence_boundary";
  bool preserve_metadata = true;
  std::string format = "plain_text";
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  IoConfig io;
  SecuritySettings security;
  ChunkingSettings chunking;
  ObservabilityConfig observability;
};

} // namespace fileweave::config
