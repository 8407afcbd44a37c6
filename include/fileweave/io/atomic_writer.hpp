#pragma once

#include "fileweave/common/result.hpp"
#include "fileweave/io/file_sink.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace fileweave::io {

enum class AtomicWriteState { Writing, Committed, Cancelled };

// Writes go to a freshly created sibling "<target>.tmp" file that is renamed
// over the target on commit(). If that name is already taken, by a stale file
// or a symlink, the existing entry is left alone and a unique
// "<target>.<hex>.tmp" is used instead. Destroying a writer that was neither
// committed nor cancelled removes the temporary file, discarding anything
// written so far.
class AtomicFileWriter {
public:
  [[nodiscard]] static common::Result<AtomicFileWriter> create(const std::filesystem::path &path);

  AtomicFileWriter(const AtomicFileWriter &) = delete;
  AtomicFileWriter &operator=(const AtomicFileWriter &) = delete;
  AtomicFileWriter(AtomicFileWriter &&other) noexcept;
  AtomicFileWriter &operator=(AtomicFileWriter &&other) noexcept;
  ~AtomicFileWriter();

  [[nodiscard]] common::Status write(std::string_view data);
  [[nodiscard]] common::Status write(const std::vector<std::uint8_t> &data);
  [[nodiscard]] common::Status commit();
  [[nodiscard]] common::Status cancel();

  [[nodiscard]] AtomicWriteState state() const { return state_; }
  [[nodiscard]] const std::filesystem::path &target_path() const { return target_; }
  [[nodiscard]] const std::filesystem::path &temp_path() const { return temp_; }
  [[nodiscard]] std::uint64_t bytes_written() const;

private:
  AtomicFileWriter(std::filesystem::path target, std::filesystem::path temp, FileSink sink);
  [[nodiscard]] common::Status require_writing(std::string_view operation) const;
  void discard_temp();

  std::filesystem::path target_;
  std::filesystem::path temp_;
  std::optional<FileSink> sink_;
  AtomicWriteState state_ = AtomicWriteState::Writing;
};

[[nodiscard]] std::filesystem::path temp_path_for(const std::filesystem::path &target);

} // namespace fileweave::io
