#include "fileweave/chunking/engine.hpp"

#include "fileweave/io/file_reader.hpp"
#include "fileweave/observability/global.hpp"

#include <chrono>

namespace fileweave::chunking {

namespace {

constexpr const char *COMPONENT = "chunking";

void strip_metadata(ChunkMetadata &metadata) {
  metadata.source_file.reset();
  metadata.timestamp_range.reset();
  metadata.participants.clear();
  metadata.topics.clear();
  metadata.parent_chunk.reset();
  metadata.child_chunks.clear();
}

} // namespace

ChunkingEngine::ChunkingEngine(ChunkingConfig config, std::unique_ptr<IChunker> chunker)
    : config_(config), chunker_(std::move(chunker)) {}

common::Result<ChunkingEngine> ChunkingEngine::create(const ChunkingConfig &config) {
  auto chunker = create_chunker(config);
  if (!chunker.ok()) {
    observability::record_error(COMPONENT, chunker.error());
    return common::Result<ChunkingEngine>::failure(chunker.error_info());
  }
  return common::Result<ChunkingEngine>::success(
      ChunkingEngine(config, std::move(chunker.value())));
}

common::Result<std::vector<DocumentChunk>>
ChunkingEngine::chunk(const std::string_view content,
                      const std::optional<std::string> &source_file) const {
  const auto started = std::chrono::steady_clock::now();
  auto chunks = chunker_->chunk(content);
  if (!chunks.ok()) {
    observability::record_error(COMPONENT, chunks.error());
    return chunks;
  }

  for (auto &chunk : chunks.value()) {
    if (config_.preserve_metadata) {
      chunk.metadata.source_file = source_file;
    } else {
      strip_metadata(chunk.metadata);
    }
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_chunking(std::string(chunker_->name()), chunks.value().size(),
                                 content.size(), elapsed, source_file);
  return chunks;
}

common::Result<std::vector<DocumentChunk>>
ChunkingEngine::chunk_file(const std::filesystem::path &path, const io::StrategySelector &selector,
                           const std::uint64_t max_file_size) const {
  auto reader = io::FileReader::open(path, selector, max_file_size);
  if (!reader.ok()) {
    return common::Result<std::vector<DocumentChunk>>::failure(reader.error_info());
  }
  auto text = reader.value().read_string();
  if (!text.ok()) {
    return common::Result<std::vector<DocumentChunk>>::failure(text.error_info());
  }
  return chunk(text.value(), path.string());
}

} // namespace fileweave::chunking
