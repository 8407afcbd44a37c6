#pragma once

#include "fileweave/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fileweave::io {

enum class WriteMode { Truncate, Append };

// Buffered writer over a raw descriptor. Truncating opens take the exclusive
// advisory lock first, so a file currently mapped by a MappedFile is reported
// as a ConcurrencyError instead of being shrunk under the mapping.
class FileSink {
public:
  static constexpr std::size_t DEFAULT_BUFFER_CAPACITY = 64 * 1024;

  [[nodiscard]] static common::Result<FileSink>
  open(const std::filesystem::path &path, WriteMode mode,
       std::size_t buffer_capacity = DEFAULT_BUFFER_CAPACITY);
  // Creates a new file and never reuses an existing entry. A file or symlink
  // already at `path` is left untouched and reported as a ConcurrencyError.
  [[nodiscard]] static common::Result<FileSink>
  create_exclusive(const std::filesystem::path &path,
                   std::size_t buffer_capacity = DEFAULT_BUFFER_CAPACITY);

  FileSink(const FileSink &) = delete;
  FileSink &operator=(const FileSink &) = delete;
  FileSink(FileSink &&other) noexcept;
  FileSink &operator=(FileSink &&other) noexcept;
  // Closes the descriptor without flushing; buffered bytes are discarded.
  ~FileSink();

  [[nodiscard]] common::Status write(std::string_view data);
  [[nodiscard]] common::Status flush();
  [[nodiscard]] common::Status sync();
  [[nodiscard]] common::Status close();
  [[nodiscard]] common::Status copy_permissions_from(const std::filesystem::path &source);

  [[nodiscard]] bool is_open() const { return fd_ >= 0; }
  [[nodiscard]] std::uint64_t bytes_written() const { return bytes_written_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  FileSink(std::filesystem::path path, int fd, std::size_t buffer_capacity);
  [[nodiscard]] common::Status write_all(std::string_view data);
  void discard();

  std::filesystem::path path_;
  int fd_ = -1;
  std::size_t buffer_capacity_ = DEFAULT_BUFFER_CAPACITY;
  std::string buffer_;
  std::uint64_t bytes_written_ = 0;
};

} // namespace fileweave::io
