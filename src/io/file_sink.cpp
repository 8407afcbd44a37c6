#include "fileweave/io/file_sink.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <system_error>
#include <utility>

namespace fileweave::io {

namespace {

std::error_code last_error() { return {errno, std::generic_category()}; }

} // namespace

FileSink::FileSink(std::filesystem::path path, const int fd, const std::size_t buffer_capacity)
    : path_(std::move(path)), fd_(fd), buffer_capacity_(buffer_capacity) {
  buffer_.reserve(buffer_capacity_);
}

common::Result<FileSink> FileSink::open(const std::filesystem::path &path, const WriteMode mode,
                                        const std::size_t buffer_capacity) {
  int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
  if (mode == WriteMode::Append) {
    flags |= O_APPEND;
  }

  const int fd = ::open(path.c_str(), flags, 0644);
  if (fd < 0) {
    return common::Result<FileSink>::failure(
        common::from_error_code(path, "open for write", last_error()));
  }

  if (mode == WriteMode::Truncate) {
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      const auto ec = last_error();
      ::close(fd);
      if (ec.value() == EWOULDBLOCK) {
        return common::Result<FileSink>::failure(common::make_error(
            common::ErrorKind::ConcurrencyError, path, "file is mapped by an open reader"));
      }
      return common::Result<FileSink>::failure(common::from_error_code(path, "flock", ec));
    }
    if (::ftruncate(fd, 0) != 0) {
      const auto ec = last_error();
      ::close(fd);
      return common::Result<FileSink>::failure(common::from_error_code(path, "truncate", ec));
    }
  }

  return common::Result<FileSink>::success(
      FileSink(path, fd, buffer_capacity == 0 ? DEFAULT_BUFFER_CAPACITY : buffer_capacity));
}

common::Result<FileSink> FileSink::create_exclusive(const std::filesystem::path &path,
                                                    const std::size_t buffer_capacity) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0644);
  if (fd < 0) {
    const auto ec = last_error();
    if (ec.value() == EEXIST || ec.value() == ELOOP) {
      return common::Result<FileSink>::failure(common::make_error(
          common::ErrorKind::ConcurrencyError, path, "file already exists"));
    }
    return common::Result<FileSink>::failure(common::from_error_code(path, "create", ec));
  }
  return common::Result<FileSink>::success(
      FileSink(path, fd, buffer_capacity == 0 ? DEFAULT_BUFFER_CAPACITY : buffer_capacity));
}

FileSink::FileSink(FileSink &&other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)),
      buffer_capacity_(other.buffer_capacity_), buffer_(std::move(other.buffer_)),
      bytes_written_(std::exchange(other.bytes_written_, 0)) {}

FileSink &FileSink::operator=(FileSink &&other) noexcept {
  if (this != &other) {
    discard();
    path_ = std::move(other.path_);
    fd_ = std::exchange(other.fd_, -1);
    buffer_capacity_ = other.buffer_capacity_;
    buffer_ = std::move(other.buffer_);
    bytes_written_ = std::exchange(other.bytes_written_, 0);
  }
  return *this;
}

FileSink::~FileSink() { discard(); }

void FileSink::discard() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  buffer_.clear();
}

common::Status FileSink::write(std::string_view data) {
  if (fd_ < 0) {
    return common::Status::failure(common::invalid_state("write on closed file " + path_.string()));
  }

  if (buffer_.size() + data.size() <= buffer_capacity_) {
    buffer_.append(data);
    bytes_written_ += data.size();
    return common::Status::success();
  }

  auto flushed = flush();
  if (!flushed.ok()) {
    return flushed;
  }
  if (data.size() >= buffer_capacity_) {
    auto written = write_all(data);
    if (!written.ok()) {
      return written;
    }
  } else {
    buffer_.append(data);
  }
  bytes_written_ += data.size();
  return common::Status::success();
}

common::Status FileSink::write_all(std::string_view data) {
  while (!data.empty()) {
    const ssize_t n = ::write(fd_, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return common::Status::failure(common::from_error_code(path_, "write", last_error()));
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return common::Status::success();
}

common::Status FileSink::flush() {
  if (fd_ < 0) {
    return common::Status::failure(common::invalid_state("flush on closed file " + path_.string()));
  }
  if (buffer_.empty()) {
    return common::Status::success();
  }
  auto written = write_all(buffer_);
  buffer_.clear();
  return written;
}

common::Status FileSink::sync() {
  auto flushed = flush();
  if (!flushed.ok()) {
    return flushed;
  }
  if (::fsync(fd_) != 0) {
    return common::Status::failure(common::from_error_code(path_, "fsync", last_error()));
  }
  return common::Status::success();
}

common::Status FileSink::close() {
  if (fd_ < 0) {
    return common::Status::success();
  }
  auto flushed = flush();
  const int fd = std::exchange(fd_, -1);
  if (::close(fd) != 0 && flushed.ok()) {
    return common::Status::failure(common::from_error_code(path_, "close", last_error()));
  }
  return flushed;
}

common::Status FileSink::copy_permissions_from(const std::filesystem::path &source) {
  if (fd_ < 0) {
    return common::Status::failure(common::invalid_state("chmod on closed file " + path_.string()));
  }
  struct stat st {};
  if (::stat(source.c_str(), &st) != 0) {
    return common::Status::failure(common::from_error_code(source, "stat", last_error()));
  }
  if (::fchmod(fd_, st.st_mode & 07777) != 0) {
    return common::Status::failure(common::from_error_code(path_, "chmod", last_error()));
  }
  return common::Status::success();
}

} // namespace fileweave::io
