#include "fileweave/config/config.hpp"

#include "fileweave/chunking/types.hpp"
#include "fileweave/common/fs.hpp"
#include "fileweave/common/glob.hpp"
#include "fileweave/common/toml.hpp"
#include "fileweave/io/atomic_writer.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fileweave::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".fileweave";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("FILEWEAVE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::uint64_t> env_u64(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

common::Error config_error(const std::string &message) {
  return common::make_error(common::ErrorKind::InvalidConfig, message);
}

void load_io_config(Config &config, const common::TomlDocument &doc) {
  config.io.small_file_threshold = doc.get_u64("io.small_file_threshold", config.io.small_file_threshold);
  config.io.medium_file_threshold =
      doc.get_u64("io.medium_file_threshold", config.io.medium_file_threshold);
  config.io.stream_chunk_size = doc.get_u64("io.stream_chunk_size", config.io.stream_chunk_size);
  config.io.max_file_size = doc.get_u64("io.max_file_size", config.io.max_file_size);
}

void load_security_config(Config &config, const common::TomlDocument &doc) {
  config.security.base_dir = doc.get_string("security.base_dir", config.security.base_dir);
  config.security.allow_hidden = doc.get_bool("security.allow_hidden", config.security.allow_hidden);
  config.security.follow_symlinks =
      doc.get_bool("security.follow_symlinks", config.security.follow_symlinks);
  if (const auto depth = doc.get_optional_u64("security.max_depth"); depth.has_value()) {
    config.security.max_depth = static_cast<std::size_t>(*depth);
  }
  config.security.denied_patterns =
      doc.get_string_array("security.denied_patterns", config.security.denied_patterns);
}

void load_chunking_config(Config &config, const common::TomlDocument &doc) {
  config.chunking.max_chunk_size = static_cast<std::size_t>(
      doc.get_u64("chunking.max_chunk_size", config.chunking.max_chunk_size));
  config.chunking.overlap_size = static_cast<std::size_t>(
      doc.get_u64("chunking.overlap_size", config.chunking.overlap_size));
  config.chunking.strategy = doc.get_string("chunking.strategy", config.chunking.strategy);
  config.chunking.preserve_metadata =
      doc.get_bool("chunking.preserve_metadata", config.chunking.preserve_metadata);
  config.chunking.format = doc.get_string("chunking.format", config.chunking.format);
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = ".";
    }
    return common::Result<std::filesystem::path>::success(parent);
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error_info());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  auto path = config_path();
  if (!path.ok()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (const auto value = env_u64("FILEWEAVE_SMALL_THRESHOLD"); value.has_value()) {
    config.io.small_file_threshold = *value;
  }
  if (const auto value = env_u64("FILEWEAVE_MEDIUM_THRESHOLD"); value.has_value()) {
    config.io.medium_file_threshold = *value;
  }
  if (const auto value = env_u64("FILEWEAVE_STREAM_CHUNK_SIZE"); value.has_value()) {
    config.io.stream_chunk_size = *value;
  }
  if (const auto value = env_u64("FILEWEAVE_MAX_FILE_SIZE"); value.has_value()) {
    config.io.max_file_size = *value;
  }
  if (const char *base = std::getenv("FILEWEAVE_BASE_DIR"); base != nullptr && *base != '\0') {
    config.security.base_dir = base;
  }
  if (const char *backend = std::getenv("FILEWEAVE_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error_info());
  }

  const auto &doc = parsed.value();
  Config config;
  load_io_config(config, doc);
  load_security_config(config, doc);
  load_chunking_config(config, doc);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error_info());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::make_error(
        common::ErrorKind::PermissionDenied, path, "unable to open config file"));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    auto error = config.error_info();
    error.message = path.string() + ": " + error.message;
    error.path = path;
    return common::Result<Config>::failure(std::move(error));
  }

  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[io]\n";
  out << "small_file_threshold = " << config.io.small_file_threshold << "\n";
  out << "medium_file_threshold = " << config.io.medium_file_threshold << "\n";
  out << "stream_chunk_size = " << config.io.stream_chunk_size << "\n";
  out << "max_file_size = " << config.io.max_file_size << "\n\n";

  out << "[security]\n";
  if (!config.security.base_dir.empty()) {
    out << "base_dir = " << common::quote_toml_string(config.security.base_dir) << "\n";
  }
  out << "allow_hidden = " << bool_to_toml(config.security.allow_hidden) << "\n";
  out << "follow_symlinks = " << bool_to_toml(config.security.follow_symlinks) << "\n";
  if (config.security.max_depth.has_value()) {
    out << "max_depth = " << *config.security.max_depth << "\n";
  }
  if (!config.security.denied_patterns.empty()) {
    out << "denied_patterns = " << common::toml_string_array(config.security.denied_patterns)
        << "\n";
  }
  out << "\n";

  out << "[chunking]\n";
  out << "max_chunk_size = " << config.chunking.max_chunk_size << "\n";
  out << "overlap_size = " << config.chunking.overlap_size << "\n";
  out << "strategy = " << common::quote_toml_string(config.chunking.strategy) << "\n";
  out << "preserve_metadata = " << bool_to_toml(config.chunking.preserve_metadata) << "\n";
  out << "format = " << common::quote_toml_string(config.chunking.format) << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config_to(const Config &config, const std::filesystem::path &path) {
  auto writer = io::AtomicFileWriter::create(path);
  if (!writer.ok()) {
    return common::Status::failure(writer.error_info());
  }
  if (auto written = writer.value().write(render_config(config)); !written.ok()) {
    return written;
  }
  return writer.value().commit();
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Status::failure(path.error_info());
  }
  return save_config_to(config, path.value());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.io.small_file_threshold == 0) {
    return Warnings::failure(config_error("io.small_file_threshold must be greater than 0"));
  }
  if (config.io.small_file_threshold >= config.io.medium_file_threshold) {
    return Warnings::failure(
        config_error("io.small_file_threshold must be below io.medium_file_threshold"));
  }
  if (config.io.stream_chunk_size == 0) {
    return Warnings::failure(config_error("io.stream_chunk_size must be greater than 0"));
  }
  if (config.io.max_file_size == 0) {
    warnings.push_back("io.max_file_size is 0; file size limit disabled");
  }

  if (config.chunking.max_chunk_size == 0) {
    return Warnings::failure(config_error("chunking.max_chunk_size must be greater than 0"));
  }
  if (config.chunking.overlap_size >= config.chunking.max_chunk_size) {
    return Warnings::failure(
        config_error("chunking.overlap_size must be smaller than chunking.max_chunk_size"));
  }
  if (!chunking::chunk_strategy_from_string(config.chunking.strategy).ok()) {
    return Warnings::failure(config_error("Invalid chunking.strategy: " + config.chunking.strategy));
  }
  if (!chunking::document_format_from_string(config.chunking.format).ok()) {
    return Warnings::failure(config_error("Invalid chunking.format: " + config.chunking.format));
  }

  for (const auto &pattern : config.security.denied_patterns) {
    auto compiled = common::GlobPattern::compile(pattern);
    if (!compiled.ok()) {
      return Warnings::failure(compiled.error_info());
    }
  }
  if (config.security.base_dir.empty()) {
    warnings.push_back("security.base_dir is not set; paths are not confined to a directory");
  }
  if (config.security.max_depth.has_value() && *config.security.max_depth == 0) {
    warnings.push_back("security.max_depth is 0; only root-level paths will validate");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace fileweave::config
