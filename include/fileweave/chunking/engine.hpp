#pragma once

#include "fileweave/chunking/chunker.hpp"
#include "fileweave/io/strategy.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace fileweave::chunking {

class ChunkingEngine {
public:
  [[nodiscard]] static common::Result<ChunkingEngine> create(const ChunkingConfig &config);

  [[nodiscard]] common::Result<std::vector<DocumentChunk>>
  chunk(std::string_view content,
        const std::optional<std::string> &source_file = std::nullopt) const;

  // Reads the file as UTF-8 text and chunks it with the file path recorded as
  // the source.
  [[nodiscard]] common::Result<std::vector<DocumentChunk>>
  chunk_file(const std::filesystem::path &path, const io::StrategySelector &selector = {},
             std::uint64_t max_file_size = 0) const;

  [[nodiscard]] const ChunkingConfig &config() const { return config_; }
  [[nodiscard]] const IChunker &chunker() const { return *chunker_; }

private:
  ChunkingEngine(ChunkingConfig config, std::unique_ptr<IChunker> chunker);

  ChunkingConfig config_;
  std::unique_ptr<IChunker> chunker_;
};

} // namespace fileweave::chunking
