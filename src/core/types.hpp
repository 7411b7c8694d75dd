#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "error.hpp"

namespace mcp_remote {

using json = nlohmann::json;

using Timestamp = std::chrono::system_clock::time_point;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(Error err) {
    return Result{std::nullopt, std::move(err)};
  }

  static Result failure(ErrorKind kind, std::string message) {
    return failure(Error{kind, std::move(message)});
  }
};

// Outcome of an operation with no value
struct Status {
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Status success() {
    return Status{};
  }

  static Status failure(Error err) {
    return Status{std::move(err)};
  }

  static Status failure(ErrorKind kind, std::string message) {
    return Status{Error{kind, std::move(message)}};
  }
};

}  // namespace mcp_remote
