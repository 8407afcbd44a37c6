#include "fileweave/io/mapped_file.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <system_error>
#include <utility>

namespace fileweave::io {

namespace {

std::error_code last_error() { return {errno, std::generic_category()}; }

} // namespace

MappedFile::MappedFile(std::filesystem::path path, const int fd, void *data,
                       const std::size_t size)
    : path_(std::move(path)), fd_(fd), data_(data), size_(size) {}

common::Result<MappedFile> MappedFile::open(const std::filesystem::path &path) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return common::Result<MappedFile>::failure(
        common::from_error_code(path, "open for mapping", last_error()));
  }

  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    const auto ec = last_error();
    ::close(fd);
    return common::Result<MappedFile>::failure(common::from_error_code(path, "stat", ec));
  }
  if (!S_ISREG(st.st_mode)) {
    ::close(fd);
    return common::Result<MappedFile>::failure(
        common::make_error(common::ErrorKind::NotAFile, path, "not a regular file"));
  }
  if (st.st_size == 0) {
    ::close(fd);
    return common::Result<MappedFile>::failure(
        common::make_error(common::ErrorKind::Io, path, "cannot map an empty file"));
  }

  if (::flock(fd, LOCK_SH | LOCK_NB) != 0) {
    const auto ec = last_error();
    ::close(fd);
    if (ec.value() == EWOULDBLOCK) {
      return common::Result<MappedFile>::failure(common::make_error(
          common::ErrorKind::ConcurrencyError, path, "file is locked by a writer"));
    }
    return common::Result<MappedFile>::failure(common::from_error_code(path, "flock", ec));
  }

  const auto size = static_cast<std::size_t>(st.st_size);
  void *data = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (data == MAP_FAILED) {
    const auto ec = last_error();
    ::close(fd);
    return common::Result<MappedFile>::failure(common::from_error_code(path, "mmap", ec));
  }
  ::madvise(data, size, MADV_SEQUENTIAL);

  return common::Result<MappedFile>::success(MappedFile(path, fd, data, size));
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)),
      data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)) {}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    fd_ = std::exchange(other.fd_, -1);
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
  }
  return *this;
}

MappedFile::~MappedFile() { release(); }

void MappedFile::release() {
  if (data_ != nullptr) {
    ::munmap(data_, size_);
    data_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  size_ = 0;
}

} // namespace fileweave::io
