#include "fileweave/observability/global.hpp"
#include "fileweave/observability/noop_observer.hpp"

#include <iostream>
#include <memory>

void run_chunking_benchmark();
void run_io_benchmark();
void run_config_benchmark();

int main() {
  fileweave::observability::set_global_observer(
      std::make_unique<fileweave::observability::NoopObserver>());

  std::cout << "fileweave benchmarks\n";
  run_chunking_benchmark();
  run_io_benchmark();
  run_config_benchmark();
  return 0;
}
