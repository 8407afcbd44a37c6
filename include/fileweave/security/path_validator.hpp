#pragma once

#include "fileweave/common/result.hpp"
#include "fileweave/config/schema.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fileweave::security {

extern const std::array<const char *, 8> DEFAULT_DENIED_PATTERNS;

// Rejects raw traversal sequences before touching the disk, then resolves the
// path (symlinks, "." and "..") and, when base_dir is given, requires the
// result to stay under the canonical base. Directories are rejected.
[[nodiscard]] common::Result<std::filesystem::path>
validate_path(const std::filesystem::path &path,
              const std::optional<std::filesystem::path> &base_dir = std::nullopt);

// NUL bytes and control characters other than whitespace are rejected.
[[nodiscard]] common::Status validate_path_characters(const std::filesystem::path &path);

class SecurityConfig {
public:
  std::optional<std::filesystem::path> base_dir;
  bool allow_hidden = false;
  bool follow_symlinks = true;
  std::optional<std::size_t> max_depth;
  std::vector<std::string> denied_patterns;

  SecurityConfig();

  [[nodiscard]] static SecurityConfig with_base_dir(std::filesystem::path base);
  [[nodiscard]] static common::Result<SecurityConfig>
  from_settings(const config::SecuritySettings &settings);

  SecurityConfig &allowing_hidden(bool allow);
  SecurityConfig &following_symlinks(bool follow);
  SecurityConfig &limit_depth(std::size_t depth);

  [[nodiscard]] common::Result<std::filesystem::path>
  validate_path(const std::filesystem::path &path) const;
  [[nodiscard]] bool is_path_allowed(const std::filesystem::path &path) const;
};

} // namespace fileweave::security
