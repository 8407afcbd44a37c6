#include "fileweave/security/path_validator.hpp"

#include "fileweave/common/fs.hpp"
#include "fileweave/common/glob.hpp"
#include "fileweave/observability/global.hpp"

#include <algorithm>
#include <cctype>

namespace fileweave::security {

const std::array<const char *, 8> DEFAULT_DENIED_PATTERNS = {
    "/etc/**", "/root/**",         "**/*.key",       "**/*.pem",
    "**/id_rsa*", "**/id_ed25519*", "**/id_ecdsa*", "**/id_dsa*"};

namespace {

constexpr const char *COMPONENT = "security";

template <typename T> common::Result<T> reject(common::Error error) {
  observability::record_error(COMPONENT, error.message);
  return common::Result<T>::failure(std::move(error));
}

bool has_traversal(const std::string &raw) {
  if (raw.find("../") != std::string::npos || raw.find("..\\") != std::string::npos) {
    return true;
  }
  return raw == ".." || raw.ends_with("/..") || raw.ends_with("\\..");
}

bool is_hidden(const std::filesystem::path &path) {
  const std::string name = path.filename().string();
  return name.size() > 1 && name.front() == '.' && name != "..";
}

} // namespace

common::Status validate_path_characters(const std::filesystem::path &path) {
  const std::string raw = path.string();
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const auto ch = static_cast<unsigned char>(raw[i]);
    if (ch == '\0') {
      return reject<void>(common::security_violation(path, "path contains a NUL byte"));
    }
    if ((ch < 0x20 || ch == 0x7F) && std::isspace(ch) == 0) {
      return reject<void>(common::security_violation(
          path, "path contains control character 0x" +
                    std::string(1, "0123456789abcdef"[ch >> 4]) +
                    std::string(1, "0123456789abcdef"[ch & 0x0F]) + " at offset " +
                    std::to_string(i)));
    }
  }
  return common::Status::success();
}

common::Result<std::filesystem::path>
validate_path(const std::filesystem::path &path,
              const std::optional<std::filesystem::path> &base_dir) {
  using PathResult = common::Result<std::filesystem::path>;

  if (path.empty()) {
    return reject<std::filesystem::path>(
        common::make_error(common::ErrorKind::InvalidPath, "empty path"));
  }
  if (has_traversal(path.string())) {
    return reject<std::filesystem::path>(
        common::security_violation(path, "path traversal detected"));
  }

  std::error_code ec;
  const auto canonical = std::filesystem::canonical(path, ec);
  if (ec) {
    return reject<std::filesystem::path>(common::from_error_code(path, "canonicalize", ec));
  }

  if (base_dir.has_value()) {
    const auto canonical_base = std::filesystem::canonical(*base_dir, ec);
    if (ec) {
      return reject<std::filesystem::path>(
          common::from_error_code(*base_dir, "canonicalize base directory", ec));
    }
    if (!common::is_subpath(canonical, canonical_base)) {
      return reject<std::filesystem::path>(common::security_violation(
          path, "resolved path " + canonical.string() + " is outside base directory " +
                    canonical_base.string()));
    }
  }

  if (std::filesystem::is_directory(canonical, ec)) {
    return reject<std::filesystem::path>(
        common::make_error(common::ErrorKind::NotAFile, canonical, "path is a directory"));
  }

  return PathResult::success(canonical);
}

SecurityConfig::SecurityConfig()
    : denied_patterns(DEFAULT_DENIED_PATTERNS.begin(), DEFAULT_DENIED_PATTERNS.end()) {}

SecurityConfig SecurityConfig::with_base_dir(std::filesystem::path base) {
  SecurityConfig config;
  config.base_dir = std::move(base);
  return config;
}

common::Result<SecurityConfig>
SecurityConfig::from_settings(const config::SecuritySettings &settings) {
  SecurityConfig config;
  if (!settings.base_dir.empty()) {
    config.base_dir = std::filesystem::path(common::expand_path(settings.base_dir));
  }
  config.allow_hidden = settings.allow_hidden;
  config.follow_symlinks = settings.follow_symlinks;
  config.max_depth = settings.max_depth;

  for (const auto &pattern : settings.denied_patterns) {
    auto compiled = common::GlobPattern::compile(pattern);
    if (!compiled.ok()) {
      return common::Result<SecurityConfig>::failure(compiled.error_info());
    }
    if (std::find(config.denied_patterns.begin(), config.denied_patterns.end(), pattern) ==
        config.denied_patterns.end()) {
      config.denied_patterns.push_back(pattern);
    }
  }
  return common::Result<SecurityConfig>::success(std::move(config));
}

SecurityConfig &SecurityConfig::allowing_hidden(const bool allow) {
  allow_hidden = allow;
  return *this;
}

SecurityConfig &SecurityConfig::following_symlinks(const bool follow) {
  follow_symlinks = follow;
  return *this;
}

SecurityConfig &SecurityConfig::limit_depth(const std::size_t depth) {
  max_depth = depth;
  return *this;
}

common::Result<std::filesystem::path>
SecurityConfig::validate_path(const std::filesystem::path &path) const {
  if (auto chars = validate_path_characters(path); !chars.ok()) {
    return common::Result<std::filesystem::path>::failure(chars.error_info());
  }

  if (!allow_hidden && is_hidden(path)) {
    return reject<std::filesystem::path>(
        common::security_violation(path, "hidden files are not allowed"));
  }

  if (max_depth.has_value()) {
    const auto depth = common::path_depth(path);
    if (depth > *max_depth) {
      return reject<std::filesystem::path>(common::security_violation(
          path, "path depth " + std::to_string(depth) + " exceeds maximum " +
                    std::to_string(*max_depth)));
    }
  }

  if (!follow_symlinks) {
    std::error_code ec;
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec))) {
      return reject<std::filesystem::path>(
          common::security_violation(path, "symbolic links are not followed"));
    }
  }

  auto validated = security::validate_path(path, base_dir);
  if (!validated.ok()) {
    return validated;
  }

  const std::string canonical = validated.value().string();
  for (const auto &pattern : denied_patterns) {
    if (common::glob_match(canonical, pattern)) {
      return reject<std::filesystem::path>(
          common::security_violation(path, "matches denied pattern " + pattern));
    }
  }

  return validated;
}

bool SecurityConfig::is_path_allowed(const std::filesystem::path &path) const {
  return validate_path(path).ok();
}

} // namespace fileweave::security
