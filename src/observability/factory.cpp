#include "fileweave/observability/factory.hpp"

#include "fileweave/common/fs.hpp"
#include "fileweave/observability/log_observer.hpp"
#include "fileweave/observability/multi_observer.hpp"
#include "fileweave/observability/noop_observer.hpp"

#include <sstream>

namespace fileweave::observability {

namespace {

std::unique_ptr<IObserver> observer_for(const std::string &name) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  // Unknown names fall back to the stderr logger.
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return observer_for(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      multi->add(observer_for(name));
    }
  }
  return multi;
}

} // namespace fileweave::observability
