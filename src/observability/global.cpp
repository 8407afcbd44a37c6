#include "fileweave/observability/global.hpp"

#include <mutex>

namespace fileweave::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_file_open(const std::string &path, const std::uint64_t size,
                      std::string_view size_class, std::string_view strategy) {
  record_event(FileOpenEvent{.path = path,
                             .size = size,
                             .size_class = std::string(size_class),
                             .strategy = std::string(strategy)});
}

void record_file_write(const std::string &path, const std::uint64_t bytes, const bool atomic,
                       const bool append) {
  record_event(FileWriteEvent{.path = path, .bytes = bytes, .atomic = atomic, .append = append});
  record_metric(BytesWrittenMetric{.bytes = bytes});
}

void record_chunking(const std::string &strategy, const std::size_t chunks,
                     const std::size_t input_bytes, const std::chrono::milliseconds duration,
                     const std::optional<std::string> &source_file) {
  record_event(ChunkingEvent{.strategy = strategy,
                             .chunks = chunks,
                             .input_bytes = input_bytes,
                             .duration = duration,
                             .source_file = source_file});
  record_metric(ChunksProducedMetric{.count = chunks});
}

void record_scan(const std::string &root, const std::size_t matched) {
  record_event(ScanEvent{.root = root, .matched = matched});
}

void record_bytes_read(const std::uint64_t bytes) { record_metric(BytesReadMetric{.bytes = bytes}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace fileweave::observability
