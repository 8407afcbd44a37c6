#pragma once

#include "fileweave/common/result.hpp"
#include "fileweave/io/strategy.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fileweave::io {

struct FileInfo {
  std::uint64_t size = 0;
  FileSizeClass size_class = FileSizeClass::Small;
  std::string_view strategy;
};

// Receives consecutive byte windows; a failed status stops the iteration and
// is returned by read_chunks().
using ChunkCallback = std::function<common::Status(std::string_view window)>;

class FileReader {
public:
  // max_file_size of 0 disables the size limit.
  [[nodiscard]] static common::Result<FileReader> open(const std::filesystem::path &path,
                                                       const StrategySelector &selector = {},
                                                       std::uint64_t max_file_size = 0);

  [[nodiscard]] common::Result<std::vector<std::uint8_t>> read_bytes();
  [[nodiscard]] common::Result<std::string> read_string();
  [[nodiscard]] common::Result<std::vector<std::string>> read_lines();
  [[nodiscard]] common::Status read_chunks(std::size_t chunk_size, const ChunkCallback &callback);

  // Streaming strategy only: the next window of the configured chunk size,
  // or std::nullopt once the end of the mapping is reached.
  [[nodiscard]] common::Result<std::optional<std::string_view>> next_chunk();
  [[nodiscard]] common::Status rewind();

  [[nodiscard]] FileInfo file_info() const;
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] const ReadStrategy &strategy() const { return strategy_; }

private:
  FileReader(std::filesystem::path path, ReadStrategy strategy, std::uint64_t size,
             FileSizeClass size_class);

  [[nodiscard]] common::Result<std::string> read_raw();
  [[nodiscard]] std::optional<std::string_view> mapped_view() const;
  template <typename T> common::Result<T> fail(common::Error error) const;

  std::filesystem::path path_;
  ReadStrategy strategy_;
  std::uint64_t size_ = 0;
  FileSizeClass size_class_ = FileSizeClass::Small;
};

// Splits decoded text on "\r\n", "\n" and "\r"; a trailing line break does not
// produce an empty final line.
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

} // namespace fileweave::io
