#include "fileweave/io/atomic_writer.hpp"

#include "fileweave/common/fs.hpp"
#include "fileweave/common/hash.hpp"
#include "fileweave/observability/global.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <utility>

namespace fileweave::io {

namespace {

constexpr const char *COMPONENT = "io.atomic";
constexpr int UNIQUE_TEMP_ATTEMPTS = 8;

common::Status failed(common::Error error) {
  observability::record_error(COMPONENT, error.message);
  return common::Status::failure(std::move(error));
}

// Persists the rename itself; the data was already synced before it.
common::Status sync_directory(const std::filesystem::path &dir) {
  const auto target = dir.empty() ? std::filesystem::path(".") : dir;
  const int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return common::Status::failure(
        common::from_error_code(target, "open directory", {errno, std::generic_category()}));
  }
  const int rc = ::fsync(fd);
  const int saved_errno = errno;
  ::close(fd);
  if (rc != 0) {
    return common::Status::failure(
        common::from_error_code(target, "fsync directory", {saved_errno, std::generic_category()}));
  }
  return common::Status::success();
}

std::filesystem::path unique_temp_path_for(const std::filesystem::path &target,
                                           const std::string &suffix) {
  auto temp = target;
  temp += "." + suffix + ".tmp";
  return temp;
}

} // namespace

std::filesystem::path temp_path_for(const std::filesystem::path &target) {
  auto temp = target;
  temp += ".tmp";
  return temp;
}

AtomicFileWriter::AtomicFileWriter(std::filesystem::path target, std::filesystem::path temp,
                                   FileSink sink)
    : target_(std::move(target)), temp_(std::move(temp)), sink_(std::move(sink)) {}

common::Result<AtomicFileWriter> AtomicFileWriter::create(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    auto error = common::make_error(common::ErrorKind::NotAFile, path, "target is a directory");
    observability::record_error(COMPONENT, error.message);
    return common::Result<AtomicFileWriter>::failure(std::move(error));
  }

  auto parent = common::ensure_parent_dir(path);
  if (!parent.ok()) {
    observability::record_error(COMPONENT, parent.error());
    return common::Result<AtomicFileWriter>::failure(parent.error_info());
  }

  auto temp = temp_path_for(path);
  auto sink = FileSink::create_exclusive(temp);
  // An existing entry at the default name belongs to someone else; pick a
  // unique sibling instead of reusing or removing it.
  for (int attempt = 0;
       attempt < UNIQUE_TEMP_ATTEMPTS && !sink.ok() &&
       sink.kind() == common::ErrorKind::ConcurrencyError;
       ++attempt) {
    auto suffix = common::random_hex(8);
    if (!suffix.ok()) {
      observability::record_error(COMPONENT, suffix.error());
      return common::Result<AtomicFileWriter>::failure(suffix.error_info());
    }
    temp = unique_temp_path_for(path, suffix.value());
    sink = FileSink::create_exclusive(temp);
  }
  if (!sink.ok()) {
    observability::record_error(COMPONENT, sink.error());
    return common::Result<AtomicFileWriter>::failure(sink.error_info());
  }

  return common::Result<AtomicFileWriter>::success(
      AtomicFileWriter(path, std::move(temp), std::move(sink.value())));
}

AtomicFileWriter::AtomicFileWriter(AtomicFileWriter &&other) noexcept
    : target_(std::move(other.target_)), temp_(std::move(other.temp_)),
      sink_(std::move(other.sink_)),
      state_(std::exchange(other.state_, AtomicWriteState::Cancelled)) {
  other.sink_.reset();
}

AtomicFileWriter &AtomicFileWriter::operator=(AtomicFileWriter &&other) noexcept {
  if (this != &other) {
    if (state_ == AtomicWriteState::Writing) {
      discard_temp();
    }
    target_ = std::move(other.target_);
    temp_ = std::move(other.temp_);
    sink_ = std::move(other.sink_);
    other.sink_.reset();
    state_ = std::exchange(other.state_, AtomicWriteState::Cancelled);
  }
  return *this;
}

AtomicFileWriter::~AtomicFileWriter() {
  if (state_ == AtomicWriteState::Writing) {
    discard_temp();
  }
}

void AtomicFileWriter::discard_temp() {
  sink_.reset();
  std::error_code ec;
  std::filesystem::remove(temp_, ec);
  if (ec) {
    observability::record_error(COMPONENT, temp_.string() + ": cleanup failed: " + ec.message());
  }
  state_ = AtomicWriteState::Cancelled;
}

common::Status AtomicFileWriter::require_writing(std::string_view operation) const {
  if (state_ == AtomicWriteState::Writing && sink_.has_value()) {
    return common::Status::success();
  }
  const char *current = state_ == AtomicWriteState::Committed ? "committed" : "cancelled";
  return common::Status::failure(common::invalid_state(
      std::string(operation) + " on an atomic writer that was already " + current + " (" +
      target_.string() + ")"));
}

std::uint64_t AtomicFileWriter::bytes_written() const {
  return sink_.has_value() ? sink_->bytes_written() : 0;
}

common::Status AtomicFileWriter::write(std::string_view data) {
  if (auto ready = require_writing("write"); !ready.ok()) {
    return ready;
  }
  auto written = sink_->write(data);
  if (!written.ok()) {
    return failed(written.error_info());
  }
  return written;
}

common::Status AtomicFileWriter::write(const std::vector<std::uint8_t> &data) {
  return write(std::string_view(reinterpret_cast<const char *>(data.data()), data.size()));
}

common::Status AtomicFileWriter::commit() {
  if (auto ready = require_writing("commit"); !ready.ok()) {
    return ready;
  }

  std::error_code ec;
  if (std::filesystem::exists(target_, ec)) {
    auto perms = sink_->copy_permissions_from(target_);
    if (!perms.ok()) {
      discard_temp();
      return failed(perms.error_info());
    }
  }

  auto synced = sink_->sync();
  if (synced.ok()) {
    synced = sink_->close();
  }
  const auto bytes = sink_->bytes_written();
  if (!synced.ok()) {
    discard_temp();
    return failed(synced.error_info());
  }
  sink_.reset();

  std::filesystem::rename(temp_, target_, ec);
  if (ec) {
    auto error = common::from_error_code(target_, "atomic rename", ec);
    discard_temp();
    return failed(std::move(error));
  }
  state_ = AtomicWriteState::Committed;

  if (auto dir_synced = sync_directory(target_.parent_path()); !dir_synced.ok()) {
    observability::record_error(COMPONENT, dir_synced.error());
  }
  observability::record_file_write(target_.string(), bytes, true, false);
  return common::Status::success();
}

common::Status AtomicFileWriter::cancel() {
  if (auto ready = require_writing("cancel"); !ready.ok()) {
    return ready;
  }

  sink_.reset();
  std::error_code ec;
  std::filesystem::remove(temp_, ec);
  state_ = AtomicWriteState::Cancelled;
  if (ec) {
    return failed(common::from_error_code(temp_, "remove temporary file", ec));
  }
  return common::Status::success();
}

} // namespace fileweave::io
