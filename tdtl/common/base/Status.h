/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <folly/Expected.h>

namespace facebook::tdtl {

enum class StatusCode : int8_t {
  kOK = 0,
  kUserError = 1,
  kTypeError = 2,
  kKeyError = 3,
  kInvalid = 4,
  kNotImplemented = 5,
};

std::string_view toString(StatusCode code);

/// Status is a lightweight return value for operations that can fail on
/// malformed input without it being a bug. A successful Status carries no
/// allocation. A failed Status holds a code and a message.
///
/// Functions that return a value use Expected<T> instead, which holds either
/// the value or the failed Status.
class [[nodiscard]] Status {
 public:
  Status() noexcept : state_(nullptr) {}

  Status(StatusCode code, std::string message);

  Status(const Status& other)
      : state_(
            other.state_ == nullptr ? nullptr
                                    : std::make_unique<State>(*other.state_)) {}

  Status& operator=(const Status& other) {
    if (this != &other) {
      state_ = other.state_ == nullptr
          ? nullptr
          : std::make_unique<State>(*other.state_);
    }
    return *this;
  }

  Status(Status&& other) noexcept = default;
  Status& operator=(Status&& other) noexcept = default;

  static Status OK() {
    return Status();
  }

  template <typename... Args>
  static Status UserError(fmt::format_string<Args...> fmt, Args&&... args) {
    return Status(
        StatusCode::kUserError,
        fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static Status TypeError(fmt::format_string<Args...> fmt, Args&&... args) {
    return Status(
        StatusCode::kTypeError,
        fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static Status KeyError(fmt::format_string<Args...> fmt, Args&&... args) {
    return Status(
        StatusCode::kKeyError, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static Status Invalid(fmt::format_string<Args...> fmt, Args&&... args) {
    return Status(
        StatusCode::kInvalid, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static Status NotImplemented(
      fmt::format_string<Args...> fmt,
      Args&&... args) {
    return Status(
        StatusCode::kNotImplemented,
        fmt::format(fmt, std::forward<Args>(args)...));
  }

  bool ok() const {
    return state_ == nullptr;
  }

  StatusCode code() const {
    return ok() ? StatusCode::kOK : state_->code;
  }

  bool isUserError() const {
    return code() == StatusCode::kUserError;
  }

  bool isTypeError() const {
    return code() == StatusCode::kTypeError;
  }

  bool isKeyError() const {
    return code() == StatusCode::kKeyError;
  }

  bool isInvalid() const {
    return code() == StatusCode::kInvalid;
  }

  /// Returns the message, or an empty string for a successful Status.
  const std::string& message() const;

  /// Returns "OK" or "<code name>: <message>".
  std::string toString() const;

  bool operator==(const Status& other) const {
    return code() == other.code() && message() == other.message();
  }

 private:
  struct State {
    StatusCode code;
    std::string message;
  };

  std::unique_ptr<State> state_;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

template <typename T>
using Expected = folly::Expected<T, Status>;

} // namespace facebook::tdtl

template <>
struct fmt::formatter<facebook::tdtl::Status> : fmt::formatter<std::string> {
  auto format(const facebook::tdtl::Status& status, format_context& ctx) const {
    return fmt::formatter<std::string>::format(status.toString(), ctx);
  }
};
