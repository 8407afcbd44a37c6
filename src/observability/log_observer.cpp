#include "fileweave/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace fileweave::observability {

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(std::string_view level, const std::string &message) {
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, FileOpenEvent>) {
          log_line("DEBUG", "file.open path=" + evt.path + " size=" + std::to_string(evt.size) +
                                " class=" + evt.size_class + " strategy=" + evt.strategy);
        } else if constexpr (std::is_same_v<T, FileWriteEvent>) {
          log_line("INFO", "file.write path=" + evt.path + " bytes=" + std::to_string(evt.bytes) +
                               " atomic=" + (evt.atomic ? std::string("true") : std::string("false")) +
                               " append=" + (evt.append ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ChunkingEvent>) {
          log_line("INFO", "chunking.done strategy=" + evt.strategy +
                               " chunks=" + std::to_string(evt.chunks) +
                               " input_bytes=" + std::to_string(evt.input_bytes) +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               (evt.source_file ? " source=" + *evt.source_file : std::string()));
        } else if constexpr (std::is_same_v<T, ScanEvent>) {
          log_line("DEBUG", "scan.done root=" + evt.root + " matched=" + std::to_string(evt.matched));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BytesReadMetric>) {
          log_line("DEBUG", "metric.bytes_read=" + std::to_string(m.bytes));
        } else if constexpr (std::is_same_v<T, BytesWrittenMetric>) {
          log_line("DEBUG", "metric.bytes_written=" + std::to_string(m.bytes));
        } else if constexpr (std::is_same_v<T, ChunksProducedMetric>) {
          log_line("DEBUG", "metric.chunks_produced=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace fileweave::observability
