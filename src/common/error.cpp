#include "fileweave/common/error.hpp"

#include <cerrno>

namespace fileweave::common {

std::string_view error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::PermissionDenied:
    return "permission_denied";
  case ErrorKind::TooLarge:
    return "too_large";
  case ErrorKind::InvalidPath:
    return "invalid_path";
  case ErrorKind::DirectoryNotEmpty:
    return "directory_not_empty";
  case ErrorKind::InvalidPattern:
    return "invalid_pattern";
  case ErrorKind::EncodingError:
    return "encoding_error";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::ConcurrencyError:
    return "concurrency_error";
  case ErrorKind::InsufficientSpace:
    return "insufficient_space";
  case ErrorKind::SecurityViolation:
    return "security_violation";
  case ErrorKind::NotAFile:
    return "not_a_file";
  case ErrorKind::InvalidState:
    return "invalid_state";
  case ErrorKind::InvalidConfig:
    return "invalid_config";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

Error make_error(const ErrorKind kind, std::string message) {
  return Error{.kind = kind, .message = std::move(message), .path = std::nullopt};
}

Error make_error(const ErrorKind kind, const std::filesystem::path &path, std::string message) {
  return Error{.kind = kind, .message = path.string() + ": " + message, .path = path};
}

Error too_large(const std::uint64_t size, const std::uint64_t max) {
  return make_error(ErrorKind::TooLarge, "File too large: " + std::to_string(size) +
                                             " bytes (max " + std::to_string(max) + ")");
}

Error invalid_pattern(const std::string &pattern, const std::string &reason) {
  return make_error(ErrorKind::InvalidPattern,
                    "Invalid pattern '" + pattern + "': " + reason);
}

Error encoding_error(const std::filesystem::path &path, const std::string &reason) {
  return make_error(ErrorKind::EncodingError, path, "encoding error: " + reason);
}

Error security_violation(const std::filesystem::path &path, const std::string &reason) {
  return make_error(ErrorKind::SecurityViolation, path, "security violation: " + reason);
}

Error invalid_state(const std::string &message) {
  return make_error(ErrorKind::InvalidState, "Invalid state: " + message);
}

Error from_error_code(const std::filesystem::path &path, const std::string &action,
                      const std::error_code &ec) {
  ErrorKind kind = ErrorKind::Io;
  if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
    switch (ec.value()) {
    case ENOENT:
      kind = ErrorKind::NotFound;
      break;
    case EACCES:
    case EPERM:
      kind = ErrorKind::PermissionDenied;
      break;
    case ENOSPC:
    case EDQUOT:
      kind = ErrorKind::InsufficientSpace;
      break;
    case ENOTEMPTY:
      kind = ErrorKind::DirectoryNotEmpty;
      break;
    case EISDIR:
      kind = ErrorKind::NotAFile;
      break;
    case ENAMETOOLONG:
    case ENOTDIR:
      kind = ErrorKind::InvalidPath;
      break;
    default:
      break;
    }
  }
  return make_error(kind, path, action + " failed: " + ec.message());
}

} // namespace fileweave::common
