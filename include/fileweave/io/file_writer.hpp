#pragma once

#include "fileweave/common/result.hpp"
#include "fileweave/io/strategy.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace fileweave::io {

// Each write reopens the target: write_* truncates and replaces the content,
// append_* opens in append mode. Nothing is cached between calls, so many
// small appends should be batched by the caller.
//
// Truncating writes take the exclusive advisory lock on the target. The lock
// belongs to the open file description, so a live FileReader in this same
// process that memory-mapped the target (a medium-sized file) makes write_*
// fail with ConcurrencyError. Drop the reader before rewriting the file, or
// use write_atomic(), which replaces the file without truncating the mapping.
class FileWriter {
public:
  [[nodiscard]] static common::Result<FileWriter> create(const std::filesystem::path &path,
                                                         const StrategySelector &selector = {});

  [[nodiscard]] common::Status write_bytes(const std::vector<std::uint8_t> &data);
  [[nodiscard]] common::Status write_string(std::string_view content);
  [[nodiscard]] common::Status append_bytes(const std::vector<std::uint8_t> &data);
  [[nodiscard]] common::Status append_string(std::string_view content);
  [[nodiscard]] common::Status write_atomic(std::string_view content);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  FileWriter(std::filesystem::path path, StrategySelector selector);
  [[nodiscard]] common::Status write_with_mode(std::string_view data, WriteMode mode);

  std::filesystem::path path_;
  StrategySelector selector_;
};

} // namespace fileweave::io
