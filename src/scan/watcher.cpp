#include "fileweave/scan/watcher.hpp"

#include "fileweave/common/fs.hpp"
#include "fileweave/common/hash.hpp"
#include "fileweave/observability/global.hpp"

#include <algorithm>

namespace fileweave::scan {

namespace {

constexpr const char *COMPONENT = "scan";

template <typename T> common::Result<T> failed(common::Error error) {
  observability::record_error(COMPONENT, error.message);
  return common::Result<T>::failure(std::move(error));
}

bool path_exists(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

} // namespace

common::Result<FileSnapshot> FileSnapshot::capture(const std::filesystem::path &path) {
  std::error_code ec;
  FileSnapshot snapshot;
  snapshot.path = path;
  snapshot.size = std::filesystem::file_size(path, ec);
  if (ec) {
    return common::Result<FileSnapshot>::failure(common::from_error_code(path, "file size", ec));
  }
  snapshot.mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return common::Result<FileSnapshot>::failure(
        common::from_error_code(path, "modification time", ec));
  }
  auto digest = common::sha256_file(path);
  if (!digest.ok()) {
    return common::Result<FileSnapshot>::failure(digest.error_info());
  }
  snapshot.sha256 = digest.value();
  return common::Result<FileSnapshot>::success(std::move(snapshot));
}

common::Result<bool> FileSnapshot::has_changed() const {
  if (!path_exists(path)) {
    return common::Result<bool>::success(true);
  }
  auto current = capture(path);
  if (!current.ok()) {
    return common::Result<bool>::failure(current.error_info());
  }
  const auto &now = current.value();
  return common::Result<bool>::success(now.size != size || now.mtime != mtime ||
                                       now.sha256 != sha256);
}

std::string change_kind_to_string(const ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Modified:
    return "modified";
  case ChangeKind::Deleted:
    return "deleted";
  }
  return "modified";
}

FileWatcher::FileWatcher() : last_scan_(std::filesystem::file_time_type::clock::now()) {}

common::Status FileWatcher::collect_files(const std::filesystem::path &root,
                                          std::vector<std::filesystem::path> &out) const {
  std::error_code ec;
  if (std::filesystem::is_regular_file(root, ec)) {
    out.push_back(root);
    return common::Status::success();
  }
  if (!std::filesystem::is_directory(root, ec)) {
    return common::Status::success();
  }

  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  for (const std::filesystem::recursive_directory_iterator end{}; !ec && it != end;
       it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec)) {
      out.push_back(it->path());
    }
  }
  if (ec) {
    return failed<void>(common::from_error_code(root, "walk directory", ec));
  }
  return common::Status::success();
}

common::Status FileWatcher::watch(const std::filesystem::path &path) {
  if (!path_exists(path)) {
    return failed<void>(
        common::make_error(common::ErrorKind::NotFound, path, "cannot watch a missing path"));
  }
  if (std::find(watched_.begin(), watched_.end(), path) != watched_.end()) {
    return common::Status::success();
  }

  std::vector<std::filesystem::path> files;
  if (auto status = collect_files(path, files); !status.ok()) {
    return status;
  }
  for (const auto &file : files) {
    auto snapshot = FileSnapshot::capture(file);
    if (!snapshot.ok()) {
      return failed<void>(snapshot.error_info());
    }
    snapshots_.insert_or_assign(file.string(), std::move(snapshot.value()));
  }
  watched_.push_back(path);
  return common::Status::success();
}

void FileWatcher::drop_snapshots_under(const std::filesystem::path &root) {
  for (auto it = snapshots_.begin(); it != snapshots_.end();) {
    const auto &path = it->second.path;
    if (path == root || common::is_subpath(path, root)) {
      it = snapshots_.erase(it);
    } else {
      ++it;
    }
  }
}

bool FileWatcher::unwatch(const std::filesystem::path &path) {
  const auto it = std::find(watched_.begin(), watched_.end(), path);
  if (it == watched_.end()) {
    return false;
  }
  watched_.erase(it);
  drop_snapshots_under(path);
  return true;
}

void FileWatcher::clear() {
  watched_.clear();
  snapshots_.clear();
}

common::Result<std::vector<FileChange>> FileWatcher::poll_changes() {
  using Changes = std::vector<FileChange>;
  // Taken before the walk so that writes racing with it show up next poll.
  const auto poll_started = std::filesystem::file_time_type::clock::now();
  Changes changes;

  for (const auto &root : watched_) {
    std::vector<std::filesystem::path> files;
    if (auto status = collect_files(root, files); !status.ok()) {
      return common::Result<Changes>::failure(status.error_info());
    }
    for (const auto &file : files) {
      std::error_code ec;
      const auto mtime = std::filesystem::last_write_time(file, ec);
      if (ec || mtime <= last_scan_) {
        continue;
      }
      changes.push_back(FileChange{.path = file, .kind = ChangeKind::Modified});
      auto snapshot = FileSnapshot::capture(file);
      if (!snapshot.ok()) {
        observability::record_error(COMPONENT, snapshot.error());
        continue;
      }
      snapshots_.insert_or_assign(file.string(), std::move(snapshot.value()));
    }
  }

  for (auto it = snapshots_.begin(); it != snapshots_.end();) {
    if (!path_exists(it->second.path)) {
      changes.push_back(FileChange{.path = it->second.path, .kind = ChangeKind::Deleted});
      it = snapshots_.erase(it);
    } else {
      ++it;
    }
  }

  last_scan_ = poll_started;
  return common::Result<Changes>::success(std::move(changes));
}

} // namespace fileweave::scan
