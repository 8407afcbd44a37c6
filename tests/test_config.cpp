#include "test_framework.hpp"

#include "fileweave/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace {

using fileweave::testing::EnvGuard;

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = fileweave::config::config_path_override();
    if (next.has_value()) {
      fileweave::config::set_config_path_override(*next);
    } else {
      fileweave::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      fileweave::config::set_config_path_override(*old_override);
    } else {
      fileweave::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("fileweave-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<fileweave::tests::TestCase> &tests) {
  using fileweave::tests::require;
  namespace cfg = fileweave::config;
  namespace common = fileweave::common;

  tests.push_back({"config_path_defaults_to_home", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("FILEWEAVE_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / ".fileweave" / "config.toml",
                             "default config path mismatch");
                   }});

  tests.push_back({"config_path_prefers_override_then_env", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("FILEWEAVE_CONFIG_PATH",
                                             (home / "env.toml").string());
                     {
                       const ConfigOverrideGuard cfg_override;
                       const auto path = cfg::config_path();
                       require(path.ok(), path.error());
                       require(path.value() == home / "env.toml", "env path should be used");
                     }
                     const ConfigOverrideGuard cfg_override(home / "explicit.toml");
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / "explicit.toml", "override should win");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("FILEWEAVE_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().io.small_file_threshold == 1048576,
                             "default small threshold should be 1 MiB");
                     require(loaded.value().io.medium_file_threshold == 16777216,
                             "default medium threshold should be 16 MiB");
                     require(loaded.value().chunking.max_chunk_size == 2000,
                             "default max chunk size should be 2000");
                     require(loaded.value().chunking.overlap_size == 200,
                             "default overlap should be 200");
                     require(loaded.value().chunking.strategy == "sentence_boundary",
                             "default strategy mismatch");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "config.toml");
                     write_file(home / "config.toml", R"(
[io]
small_file_threshold = 4096
medium_file_threshold = 65_536
stream_chunk_size = 1024

[security]
base_dir = "/srv/data"
allow_hidden = true
follow_symlinks = false
max_depth = 6
denied_patterns = ["**/*.secret"]

[chunking]
max_chunk_size = 500
overlap_size = 50
strategy = "ParagraphBoundary"
format = "markdown"

[observability]
backend = "log"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.io.small_file_threshold == 4096, "small threshold mismatch");
                     require(config.io.medium_file_threshold == 65536, "medium threshold mismatch");
                     require(config.io.stream_chunk_size == 1024, "stream chunk mismatch");
                     require(config.security.base_dir == "/srv/data", "base dir mismatch");
                     require(config.security.allow_hidden, "allow_hidden should be true");
                     require(!config.security.follow_symlinks, "follow_symlinks should be false");
                     require(config.security.max_depth == std::optional<std::size_t>(6),
                             "max depth mismatch");
                     require(config.security.denied_patterns.size() == 1 &&
                                 config.security.denied_patterns[0] == "**/*.secret",
                             "denied patterns mismatch");
                     require(config.chunking.strategy == "ParagraphBoundary",
                             "strategy mismatch");
                     require(config.observability.backend == "log", "backend mismatch");
                   }});

  tests.push_back({"load_config_reports_parse_errors_with_path", [] {
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "broken.toml");
                     write_file(home / "broken.toml", "[io]\nsmall_file_threshold\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "broken config should fail");
                     require(loaded.kind() == common::ErrorKind::InvalidConfig, "kind mismatch");
                     require(loaded.error().find("broken.toml") != std::string::npos,
                             "error should name the file");
                   }});

  tests.push_back({"env_overrides_take_precedence", [] {
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "config.toml");
                     write_file(home / "config.toml", "[io]\nsmall_file_threshold = 4096\n");
                     const EnvGuard small("FILEWEAVE_SMALL_THRESHOLD", std::string("2048"));
                     const EnvGuard max_size("FILEWEAVE_MAX_FILE_SIZE", std::string("777"));
                     const EnvGuard base("FILEWEAVE_BASE_DIR", std::string("/data"));
                     const EnvGuard backend("FILEWEAVE_OBSERVABILITY", std::string("log"));
                     const EnvGuard bogus("FILEWEAVE_MEDIUM_THRESHOLD", std::string("lots"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().io.small_file_threshold == 2048,
                             "env small threshold should win");
                     require(loaded.value().io.max_file_size == 777, "env max size should win");
                     require(loaded.value().security.base_dir == "/data", "env base dir mismatch");
                     require(loaded.value().observability.backend == "log", "env backend mismatch");
                     require(loaded.value().io.medium_file_threshold == 16777216,
                             "unparseable env value should be ignored");
                   }});

  tests.push_back({"validate_config_rejects_bad_thresholds", [] {
                     cfg::Config config;
                     config.io.small_file_threshold = config.io.medium_file_threshold;
                     const auto result = cfg::validate_config(config);
                     require(!result.ok(), "small >= medium should fail");
                     require(result.kind() == common::ErrorKind::InvalidConfig, "kind mismatch");

                     cfg::Config zero_chunk;
                     zero_chunk.io.stream_chunk_size = 0;
                     require(!cfg::validate_config(zero_chunk).ok(), "zero chunk size should fail");
                   }});

  tests.push_back({"validate_config_rejects_overlap_not_below_max", [] {
                     cfg::Config config;
                     config.chunking.max_chunk_size = 100;
                     config.chunking.overlap_size = 100;
                     const auto result = cfg::validate_config(config);
                     require(!result.ok(), "overlap == max should fail");
                     require(result.error().find("overlap_size") != std::string::npos,
                             "message should name overlap_size");
                   }});

  tests.push_back({"validate_config_rejects_unknown_names_and_patterns", [] {
                     cfg::Config strategy;
                     strategy.chunking.strategy = "by_vibes";
                     require(!cfg::validate_config(strategy).ok(), "unknown strategy should fail");

                     cfg::Config format;
                     format.chunking.format = "docx";
                     require(!cfg::validate_config(format).ok(), "unknown format should fail");

                     cfg::Config pattern;
                     pattern.security.denied_patterns = {"[unterminated"};
                     const auto result = cfg::validate_config(pattern);
                     require(!result.ok(), "bad glob should fail");
                     require(result.kind() == common::ErrorKind::InvalidPattern, "kind mismatch");
                   }});

  tests.push_back({"validate_config_returns_warnings", [] {
                     cfg::Config config;
                     config.io.max_file_size = 0;
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2,
                             "expected warnings for max_file_size and base_dir");
                   }});

  tests.push_back({"render_config_round_trips", [] {
                     cfg::Config config;
                     config.io.small_file_threshold = 10;
                     config.io.medium_file_threshold = 20;
                     config.security.base_dir = "/srv/\"quoted\"";
                     config.security.max_depth = 3;
                     config.security.denied_patterns = {"/etc/**", "**/*.pem"};
                     config.chunking.strategy = "fixed_size";
                     config.observability.backend = "log,none";

                     const auto parsed = cfg::parse_config(cfg::render_config(config));
                     require(parsed.ok(), parsed.error());
                     const auto &loaded = parsed.value();
                     require(loaded.io.small_file_threshold == 10, "small threshold mismatch");
                     require(loaded.io.medium_file_threshold == 20, "medium threshold mismatch");
                     require(loaded.security.base_dir == "/srv/\"quoted\"", "base dir mismatch");
                     require(loaded.security.max_depth == std::optional<std::size_t>(3),
                             "max depth mismatch");
                     require(loaded.security.denied_patterns == config.security.denied_patterns,
                             "patterns mismatch");
                     require(loaded.chunking.strategy == "fixed_size", "strategy mismatch");
                     require(loaded.observability.backend == "log,none", "backend mismatch");
                   }});

  tests.push_back({"render_config_keeps_trailing_backslash_patterns", [] {
                     cfg::Config config;
                     config.security.denied_patterns = {"cache\\", "**/*.key", "a\\\\"};

                     const auto parsed = cfg::parse_config(cfg::render_config(config));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().security.denied_patterns ==
                                 config.security.denied_patterns,
                             "array entries must stay separate");
                   }});
}
