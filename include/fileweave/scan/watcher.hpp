#pragma once

#include "fileweave/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace fileweave::scan {

struct FileSnapshot {
  std::filesystem::path path;
  std::uint64_t size = 0;
  std::filesystem::file_time_type mtime;
  std::string sha256;

  [[nodiscard]] static common::Result<FileSnapshot> capture(const std::filesystem::path &path);

  // True when the file disappeared or its size, mtime or content hash moved.
  [[nodiscard]] common::Result<bool> has_changed() const;
};

enum class ChangeKind { Modified, Deleted };

[[nodiscard]] std::string change_kind_to_string(ChangeKind kind);

struct FileChange {
  std::filesystem::path path;
  ChangeKind kind = ChangeKind::Modified;
};

// Polling watcher. Anything whose mtime is newer than the previous poll is
// reported as Modified, so creations look like modifications. Deletions are
// reported for files that had a snapshot. Not safe for concurrent polls.
class FileWatcher {
public:
  FileWatcher();

  [[nodiscard]] common::Status watch(const std::filesystem::path &path);
  bool unwatch(const std::filesystem::path &path);
  void clear();

  [[nodiscard]] common::Result<std::vector<FileChange>> poll_changes();

  [[nodiscard]] const std::vector<std::filesystem::path> &watched() const { return watched_; }
  [[nodiscard]] std::filesystem::file_time_type last_scan() const { return last_scan_; }

private:
  [[nodiscard]] common::Status collect_files(const std::filesystem::path &root,
                                             std::vector<std::filesystem::path> &out) const;
  void drop_snapshots_under(const std::filesystem::path &root);

  std::vector<std::filesystem::path> watched_;
  std::unordered_map<std::string, FileSnapshot> snapshots_;
  std::filesystem::file_time_type last_scan_;
};

} // namespace fileweave::scan
