#pragma once

#include "fileweave/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace fileweave::io {

// Read-only mapping of a whole file. The descriptor stays open with a shared
// advisory lock (flock) for the lifetime of the mapping; writers in this
// library take the exclusive lock before truncating, so a mapped file cannot
// be resized underneath a reader by cooperating code. Non-cooperating
// processes are not covered by the lock.
class MappedFile {
public:
  [[nodiscard]] static common::Result<MappedFile> open(const std::filesystem::path &path);

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;
  ~MappedFile();

  [[nodiscard]] const char *data() const { return static_cast<const char *>(data_); }
  [[nodiscard]] std::size_t size() const { return size_; }
  [[nodiscard]] std::string_view view() const { return {data(), size_}; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  MappedFile(std::filesystem::path path, int fd, void *data, std::size_t size);
  void release();

  std::filesystem::path path_;
  int fd_ = -1;
  void *data_ = nullptr;
  std::size_t size_ = 0;
};

} // namespace fileweave::io
