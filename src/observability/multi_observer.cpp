#include "fileweave/observability/multi_observer.hpp"

namespace fileweave::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

// Children see events in the order they were added.
void MultiObserver::record_event(const ObserverEvent &event) {
  for_each_child([&event](IObserver &child) { child.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each_child([&metric](IObserver &child) { child.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each_child([](IObserver &child) { child.flush(); });
}

} // namespace fileweave::observability
