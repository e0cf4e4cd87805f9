#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace hostwarden::common {

enum class ErrorKind {
  None,
  Collection,
  Configuration,
  Transport,
  Remediation,
  Io,
};

class Status {
public:
  static Status success() { return Status(true, "", ErrorKind::None); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::Io) {
    return Status(false, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Status(bool ok, std::string error, ErrorKind kind)
      : ok_(ok), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::string error_;
  ErrorKind kind_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), "", ErrorKind::None); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Io) {
    return Result(false, std::nullopt, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(error_, kind_);
  }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorKind kind)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorKind kind_;
};

} // namespace hostwarden::common
