#include "fileweave/io/strategy.hpp"

#include "fileweave/common/fs.hpp"

#include <type_traits>

namespace fileweave::io {

std::string_view strategy_name(const ReadStrategy &strategy) {
  return std::visit(
      [](const auto &active) -> std::string_view {
        using T = std::decay_t<decltype(active)>;
        if constexpr (std::is_same_v<T, BufferedRead>) {
          return "buffered";
        } else if constexpr (std::is_same_v<T, MappedRead>) {
          return "memory_mapped";
        } else {
          return "streaming";
        }
      },
      strategy);
}

StrategySelector::StrategySelector(SizeThresholds thresholds) : thresholds_(thresholds) {}

common::Result<StrategySelector> StrategySelector::create(SizeThresholds thresholds) {
  if (!thresholds.valid()) {
    return common::Result<StrategySelector>::failure(common::make_error(
        common::ErrorKind::InvalidConfig,
        "size thresholds must satisfy 0 < small < medium and a non-zero stream chunk size"));
  }
  return common::Result<StrategySelector>::success(StrategySelector(thresholds));
}

common::Result<ReadStrategy>
StrategySelector::optimal_for_read(const std::filesystem::path &path) const {
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec) {
    return common::Result<ReadStrategy>::failure(common::from_error_code(path, "stat", ec));
  }
  if (!std::filesystem::exists(status)) {
    return common::Result<ReadStrategy>::failure(
        common::make_error(common::ErrorKind::NotFound, path, "file not found"));
  }
  if (!std::filesystem::is_regular_file(status)) {
    return common::Result<ReadStrategy>::failure(
        common::make_error(common::ErrorKind::NotAFile, path, "not a regular file"));
  }

  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return common::Result<ReadStrategy>::failure(common::from_error_code(path, "file size", ec));
  }

  switch (thresholds_.classify(size)) {
  case FileSizeClass::Small: {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
      return common::Result<ReadStrategy>::failure(common::make_error(
          common::ErrorKind::PermissionDenied, path, "unable to open file for reading"));
    }
    return common::Result<ReadStrategy>::success(
        BufferedRead{.path = path, .size = size, .stream = std::move(stream)});
  }
  case FileSizeClass::Medium: {
    auto mapped = MappedFile::open(path);
    if (!mapped.ok()) {
      return common::Result<ReadStrategy>::failure(mapped.error_info());
    }
    return common::Result<ReadStrategy>::success(MappedRead{.map = std::move(mapped.value())});
  }
  case FileSizeClass::Large: {
    auto mapped = MappedFile::open(path);
    if (!mapped.ok()) {
      return common::Result<ReadStrategy>::failure(mapped.error_info());
    }
    return common::Result<ReadStrategy>::success(
        StreamingRead{.map = std::move(mapped.value()),
                      .chunk_size = static_cast<std::size_t>(thresholds_.stream_chunk_size),
                      .offset = 0});
  }
  }
  return common::Result<ReadStrategy>::failure(common::invalid_state("unknown size class"));
}

common::Result<BufferedWrite> StrategySelector::optimal_for_write(const std::filesystem::path &path,
                                                                  const WriteMode mode) const {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return common::Result<BufferedWrite>::failure(
        common::make_error(common::ErrorKind::NotAFile, path, "target is a directory"));
  }

  auto parent = common::ensure_parent_dir(path);
  if (!parent.ok()) {
    return common::Result<BufferedWrite>::failure(parent.error_info());
  }

  auto sink = FileSink::open(path, mode);
  if (!sink.ok()) {
    return common::Result<BufferedWrite>::failure(sink.error_info());
  }
  return common::Result<BufferedWrite>::success(
      BufferedWrite{.sink = std::move(sink.value()), .mode = mode});
}

} // namespace fileweave::io
