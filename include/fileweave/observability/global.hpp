#pragma once

#include "fileweave/observability/observer.hpp"

#include <memory>

namespace fileweave::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_file_open(const std::string &path, std::uint64_t size, std::string_view size_class,
                      std::string_view strategy);
void record_file_write(const std::string &path, std::uint64_t bytes, bool atomic, bool append);
void record_chunking(const std::string &strategy, std::size_t chunks, std::size_t input_bytes,
                     std::chrono::milliseconds duration,
                     const std::optional<std::string> &source_file);
void record_scan(const std::string &root, std::size_t matched);
void record_bytes_read(std::uint64_t bytes);
void record_error(const std::string &component, const std::string &message);

} // namespace fileweave::observability
