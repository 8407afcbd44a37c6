#include "bench_common.hpp"

#include "fileweave/config/config.hpp"

void run_config_benchmark() {
  std::cout << "\n=== Config Benchmarks ===\n";

  fileweave::config::Config config;
  config.security.denied_patterns = {"**/*.key", "**/.git/**", "/etc/**"};

  fileweave::bench::run_bench("config_validate", 2000, [&] {
    (void)fileweave::config::validate_config(config);
  });

  const std::string rendered = fileweave::config::render_config(config);
  fileweave::bench::run_bench("config_parse", 2000, [&] {
    (void)fileweave::config::parse_config(rendered);
  });
}
