#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace hitlgate::common {

/// Coarse failure category carried next to the message. Callers branch on the code
/// (for example AddressInUse drives the leader/follower decision), never on message text.
enum class StatusCode {
  Ok,
  InvalidArgument,
  NotFound,
  AddressInUse,
  Unavailable,
  Internal,
};

class Status {
public:
  static Status success() { return Status(StatusCode::Ok, ""); }
  static Status error(std::string message, StatusCode code = StatusCode::Internal) {
    return Status(code == StatusCode::Ok ? StatusCode::Internal : code, std::move(message));
  }
  static Status not_found(std::string message) {
    return Status(StatusCode::NotFound, std::move(message));
  }

  [[nodiscard]] bool ok() const { return code_ == StatusCode::Ok; }
  [[nodiscard]] StatusCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(StatusCode code, std::string error) : code_(code), error_(std::move(error)) {}

  StatusCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(StatusCode::Ok, std::move(value), ""); }
  static Result failure(std::string message, StatusCode code = StatusCode::Internal) {
    return Result(code == StatusCode::Ok ? StatusCode::Internal : code, std::nullopt,
                  std::move(message));
  }
  static Result failure(const Status &status) { return failure(status.error(), status.code()); }

  [[nodiscard]] bool ok() const { return code_ == StatusCode::Ok; }
  [[nodiscard]] StatusCode code() const { return code_; }

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
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(error_, code_);
  }

private:
  Result(StatusCode code, std::optional<T> value, std::string error)
      : code_(code), value_(std::move(value)), error_(std::move(error)) {}

  StatusCode code_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace hitlgate::common
