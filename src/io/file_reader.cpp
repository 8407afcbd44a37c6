#include "fileweave/io/file_reader.hpp"

#include "fileweave/common/utf8.hpp"
#include "fileweave/observability/global.hpp"

#include <sstream>
#include <type_traits>

namespace fileweave::io {

namespace {

constexpr const char *COMPONENT = "io.reader";

} // namespace

FileReader::FileReader(std::filesystem::path path, ReadStrategy strategy, const std::uint64_t size,
                       const FileSizeClass size_class)
    : path_(std::move(path)), strategy_(std::move(strategy)), size_(size),
      size_class_(size_class) {}

template <typename T> common::Result<T> FileReader::fail(common::Error error) const {
  observability::record_error(COMPONENT, error.message);
  return common::Result<T>::failure(std::move(error));
}

common::Result<FileReader> FileReader::open(const std::filesystem::path &path,
                                            const StrategySelector &selector,
                                            const std::uint64_t max_file_size) {
  if (max_file_size > 0) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec && size > max_file_size) {
      auto error = common::too_large(size, max_file_size);
      error.message = path.string() + ": " + error.message;
      error.path = path;
      observability::record_error(COMPONENT, error.message);
      return common::Result<FileReader>::failure(std::move(error));
    }
  }

  auto strategy = selector.optimal_for_read(path);
  if (!strategy.ok()) {
    observability::record_error(COMPONENT, strategy.error());
    return common::Result<FileReader>::failure(strategy.error_info());
  }

  const std::uint64_t size = std::visit(
      [](const auto &active) -> std::uint64_t {
        using T = std::decay_t<decltype(active)>;
        if constexpr (std::is_same_v<T, BufferedRead>) {
          return active.size;
        } else {
          return active.map.size();
        }
      },
      strategy.value());
  const auto size_class = selector.thresholds().classify(size);

  observability::record_file_open(path.string(), size, size_class_to_string(size_class),
                                  strategy_name(strategy.value()));
  return common::Result<FileReader>::success(
      FileReader(path, std::move(strategy.value()), size, size_class));
}

std::optional<std::string_view> FileReader::mapped_view() const {
  if (const auto *mapped = std::get_if<MappedRead>(&strategy_); mapped != nullptr) {
    return mapped->map.view();
  }
  if (const auto *streaming = std::get_if<StreamingRead>(&strategy_); streaming != nullptr) {
    return streaming->map.view();
  }
  return std::nullopt;
}

common::Result<std::string> FileReader::read_raw() {
  if (const auto view = mapped_view(); view.has_value()) {
    observability::record_bytes_read(view->size());
    return common::Result<std::string>::success(std::string(*view));
  }

  auto &buffered = std::get<BufferedRead>(strategy_);
  buffered.stream.clear();
  buffered.stream.seekg(0, std::ios::beg);

  std::ostringstream buffer;
  buffer << buffered.stream.rdbuf();
  if (buffered.stream.bad()) {
    return fail<std::string>(common::make_error(common::ErrorKind::Io, path_, "read failed"));
  }
  std::string content = buffer.str();

  observability::record_bytes_read(content.size());
  return common::Result<std::string>::success(std::move(content));
}

common::Result<std::vector<std::uint8_t>> FileReader::read_bytes() {
  auto raw = read_raw();
  if (!raw.ok()) {
    return common::Result<std::vector<std::uint8_t>>::failure(raw.error_info());
  }
  const auto &content = raw.value();
  return common::Result<std::vector<std::uint8_t>>::success(
      std::vector<std::uint8_t>(content.begin(), content.end()));
}

common::Result<std::string> FileReader::read_string() {
  auto raw = read_raw();
  if (!raw.ok()) {
    return raw;
  }
  if (const auto invalid = common::find_invalid_utf8(raw.value()); invalid.has_value()) {
    return fail<std::string>(common::encoding_error(
        path_, "invalid UTF-8 sequence at byte offset " + std::to_string(*invalid)));
  }
  return raw;
}

common::Result<std::vector<std::string>> FileReader::read_lines() {
  auto text = read_string();
  if (!text.ok()) {
    return common::Result<std::vector<std::string>>::failure(text.error_info());
  }
  return common::Result<std::vector<std::string>>::success(split_lines(text.value()));
}

common::Status FileReader::read_chunks(const std::size_t chunk_size,
                                       const ChunkCallback &callback) {
  if (chunk_size == 0) {
    return fail<void>(common::make_error(common::ErrorKind::InvalidConfig, path_,
                                         "chunk size must be greater than zero"));
  }

  auto walk = [&](std::string_view data) -> common::Status {
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
      auto status = callback(data.substr(offset, chunk_size));
      if (!status.ok()) {
        return status;
      }
    }
    return common::Status::success();
  };

  if (const auto view = mapped_view(); view.has_value()) {
    observability::record_bytes_read(view->size());
    return walk(*view);
  }

  auto raw = read_raw();
  if (!raw.ok()) {
    return common::Status::failure(raw.error_info());
  }
  return walk(raw.value());
}

common::Result<std::optional<std::string_view>> FileReader::next_chunk() {
  auto *streaming = std::get_if<StreamingRead>(&strategy_);
  if (streaming == nullptr) {
    return fail<std::optional<std::string_view>>(common::invalid_state(
        "next_chunk requires the streaming strategy, active strategy is " +
        std::string(strategy_name(strategy_))));
  }

  const auto view = streaming->map.view();
  if (streaming->offset >= view.size()) {
    return common::Result<std::optional<std::string_view>>::success(std::nullopt);
  }
  const auto window = view.substr(streaming->offset, streaming->chunk_size);
  streaming->offset += window.size();
  observability::record_bytes_read(window.size());
  return common::Result<std::optional<std::string_view>>::success(window);
}

common::Status FileReader::rewind() {
  auto *streaming = std::get_if<StreamingRead>(&strategy_);
  if (streaming == nullptr) {
    return fail<void>(common::invalid_state("rewind requires the streaming strategy"));
  }
  streaming->offset = 0;
  return common::Status::success();
}

FileInfo FileReader::file_info() const {
  return FileInfo{.size = size_, .size_class = size_class_, .strategy = strategy_name(strategy_)};
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    const char ch = text[i];
    if (ch == '\n' || ch == '\r') {
      lines.emplace_back(text.substr(start, i - start));
      if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      start = i + 1;
    }
    ++i;
  }
  if (start < text.size()) {
    lines.emplace_back(text.substr(start));
  }
  return lines;
}

} // namespace fileweave::io
