#pragma once

#include "fileweave/common/result.hpp"
#include "fileweave/io/file_sink.hpp"
#include "fileweave/io/mapped_file.hpp"
#include "fileweave/io/size_class.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <variant>

namespace fileweave::io {

struct BufferedRead {
  std::filesystem::path path;
  std::uint64_t size = 0;
  std::ifstream stream;
};

struct MappedRead {
  MappedFile map;
};

struct StreamingRead {
  MappedFile map;
  std::size_t chunk_size = STREAM_CHUNK_SIZE;
  std::size_t offset = 0;
};

// Read and write strategies are separate types: a handle opened for reading
// can never be asked to write and vice versa.
using ReadStrategy = std::variant<BufferedRead, MappedRead, StreamingRead>;

struct BufferedWrite {
  FileSink sink;
  WriteMode mode = WriteMode::Truncate;
};

[[nodiscard]] std::string_view strategy_name(const ReadStrategy &strategy);

class StrategySelector {
public:
  StrategySelector() = default;

  // The only way to use custom thresholds; rejects sets that fail valid().
  [[nodiscard]] static common::Result<StrategySelector> create(SizeThresholds thresholds);

  [[nodiscard]] const SizeThresholds &thresholds() const { return thresholds_; }

  [[nodiscard]] common::Result<ReadStrategy>
  optimal_for_read(const std::filesystem::path &path) const;

  // Writes are never mapped. Parent directories are created when missing.
  [[nodiscard]] common::Result<BufferedWrite>
  optimal_for_write(const std::filesystem::path &path,
                    WriteMode mode = WriteMode::Truncate) const;

private:
  explicit StrategySelector(SizeThresholds thresholds);

  SizeThresholds thresholds_;
};

} // namespace fileweave::io
