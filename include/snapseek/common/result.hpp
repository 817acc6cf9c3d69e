#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace snapseek::common {

enum class ErrorKind {
  None,
  Validation,
  InvalidImage,
  ModelFailure,
  CorruptVector,
  Storage,
  Configuration,
  NotFound,
  Internal,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message) {
    return Status(ErrorKind::Internal, std::move(message));
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(ErrorKind::Internal, std::nullopt, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    if (kind == ErrorKind::None) {
      kind = ErrorKind::Internal;
    }
    return Result(kind, std::nullopt, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace snapseek::common
