#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace fileweave::observability {

struct FileOpenEvent {
  std::string path;
  std::uint64_t size = 0;
  std::string size_class;
  std::string strategy;
};

struct FileWriteEvent {
  std::string path;
  std::uint64_t bytes = 0;
  bool atomic = false;
  bool append = false;
};

struct ChunkingEvent {
  std::string strategy;
  std::size_t chunks = 0;
  std::size_t input_bytes = 0;
  std::chrono::milliseconds duration{0};
  std::optional<std::string> source_file;
};

struct ScanEvent {
  std::string root;
  std::size_t matched = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<FileOpenEvent, FileWriteEvent, ChunkingEvent, ScanEvent, ErrorEvent>;

struct BytesReadMetric {
  std::uint64_t bytes = 0;
};

struct BytesWrittenMetric {
  std::uint64_t bytes = 0;
};

struct ChunksProducedMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<BytesReadMetric, BytesWrittenMetric, ChunksProducedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace fileweave::observability
