#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace fileweave::common {

enum class ErrorKind {
  NotFound,
  PermissionDenied,
  TooLarge,
  InvalidPath,
  DirectoryNotEmpty,
  InvalidPattern,
  EncodingError,
  Timeout,
  ConcurrencyError,
  InsufficientSpace,
  SecurityViolation,
  NotAFile,
  InvalidState,
  InvalidConfig,
  Io,
  Internal,
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::Internal;
  std::string message;
  std::optional<std::filesystem::path> path;
};

[[nodiscard]] Error make_error(ErrorKind kind, std::string message);
[[nodiscard]] Error make_error(ErrorKind kind, const std::filesystem::path &path,
                               std::string message);

[[nodiscard]] Error too_large(std::uint64_t size, std::uint64_t max);
[[nodiscard]] Error invalid_pattern(const std::string &pattern, const std::string &reason);
[[nodiscard]] Error encoding_error(const std::filesystem::path &path, const std::string &reason);
[[nodiscard]] Error security_violation(const std::filesystem::path &path,
                                       const std::string &reason);
[[nodiscard]] Error invalid_state(const std::string &message);

// Wraps an OS failure with the path being operated on. errno values with a
// dedicated kind are mapped, everything else becomes ErrorKind::Io.
[[nodiscard]] Error from_error_code(const std::filesystem::path &path, const std::string &action,
                                   const std::error_code &ec);

} // namespace fileweave::common
