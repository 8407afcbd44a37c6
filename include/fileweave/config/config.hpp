#pragma once

#include "fileweave/common/result.hpp"
#include "fileweave/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fileweave::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] common::Status save_config_to(const Config &config, const std::filesystem::path &path);
[[nodiscard]] std::string render_config(const Config &config);

// Fails on settings that would make an operation ill-defined; returns
// non-fatal warnings otherwise.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace fileweave::config
