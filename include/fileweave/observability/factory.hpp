#pragma once

#include "fileweave/config/schema.hpp"
#include "fileweave/observability/observer.hpp"

#include <memory>

namespace fileweave::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace fileweave::observability
