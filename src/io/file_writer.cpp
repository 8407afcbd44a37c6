#include "fileweave/io/file_writer.hpp"

#include "fileweave/common/fs.hpp"
#include "fileweave/io/atomic_writer.hpp"
#include "fileweave/observability/global.hpp"

namespace fileweave::io {

namespace {

constexpr const char *COMPONENT = "io.writer";

common::Status failed(const common::Error &error) {
  observability::record_error(COMPONENT, error.message);
  return common::Status::failure(error);
}

std::string_view as_view(const std::vector<std::uint8_t> &data) {
  return {reinterpret_cast<const char *>(data.data()), data.size()};
}

} // namespace

FileWriter::FileWriter(std::filesystem::path path, StrategySelector selector)
    : path_(std::move(path)), selector_(selector) {}

common::Result<FileWriter> FileWriter::create(const std::filesystem::path &path,
                                              const StrategySelector &selector) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    auto error = common::make_error(common::ErrorKind::NotAFile, path, "target is a directory");
    observability::record_error(COMPONENT, error.message);
    return common::Result<FileWriter>::failure(std::move(error));
  }
  if (auto parent = common::ensure_parent_dir(path); !parent.ok()) {
    observability::record_error(COMPONENT, parent.error());
    return common::Result<FileWriter>::failure(parent.error_info());
  }
  return common::Result<FileWriter>::success(FileWriter(path, selector));
}

common::Status FileWriter::write_with_mode(std::string_view data, const WriteMode mode) {
  auto strategy = selector_.optimal_for_write(path_, mode);
  if (!strategy.ok()) {
    return failed(strategy.error_info());
  }

  auto &sink = strategy.value().sink;
  auto status = sink.write(data);
  if (status.ok()) {
    status = sink.close();
  }
  if (!status.ok()) {
    return failed(status.error_info());
  }

  observability::record_file_write(path_.string(), data.size(), false, mode == WriteMode::Append);
  return common::Status::success();
}

common::Status FileWriter::write_bytes(const std::vector<std::uint8_t> &data) {
  return write_with_mode(as_view(data), WriteMode::Truncate);
}

common::Status FileWriter::write_string(std::string_view content) {
  return write_with_mode(content, WriteMode::Truncate);
}

common::Status FileWriter::append_bytes(const std::vector<std::uint8_t> &data) {
  return write_with_mode(as_view(data), WriteMode::Append);
}

common::Status FileWriter::append_string(std::string_view content) {
  return write_with_mode(content, WriteMode::Append);
}

common::Status FileWriter::write_atomic(std::string_view content) {
  auto writer = AtomicFileWriter::create(path_);
  if (!writer.ok()) {
    return common::Status::failure(writer.error_info());
  }
  if (auto written = writer.value().write(content); !written.ok()) {
    return written;
  }
  return writer.value().commit();
}

} // namespace fileweave::io
