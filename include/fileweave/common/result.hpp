#pragma once

#include "fileweave/common/error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace fileweave::common {

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), Error{}); }
  static Result failure(std::string message) {
    return failure(make_error(ErrorKind::Internal, std::move(message)));
  }
  static Result failure(Error error) { return Result(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorKind kind() const { return error_.kind; }
  [[nodiscard]] const Error &error_info() const { return error_; }

private:
  Result(std::optional<T> value, Error error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  Error error_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, Error{}); }
  static Result failure(std::string message) {
    return failure(make_error(ErrorKind::Internal, std::move(message)));
  }
  static Result failure(Error error) { return Result(false, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorKind kind() const { return error_.kind; }
  [[nodiscard]] const Error &error_info() const { return error_; }

private:
  Result(bool ok, Error error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  Error error_;
};

using Status = Result<void>;

} // namespace fileweave::common
