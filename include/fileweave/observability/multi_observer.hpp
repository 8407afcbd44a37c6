#pragma once

#include "fileweave/observability/observer.hpp"

#include <memory>
#include <vector>

namespace fileweave::observability {

class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  template <typename Fn> void for_each_child(Fn &&fn) {
    for (auto &observer : observers_) {
      fn(*observer);
    }
  }

  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace fileweave::observability
