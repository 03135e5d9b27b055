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

#include <exception>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace facebook::tdtl {

namespace error_source {
/// Errors where the root cause of the problem is a bug in the library or one
/// of its callers, e.g. a violated precondition.
inline constexpr const char* kErrorSourceRuntime = "RUNTIME";

/// Errors where the root cause of the problem is some unsupported or
/// malformed input supplied by the user.
inline constexpr const char* kErrorSourceUser = "USER";
} // namespace error_source

namespace error_code {
inline constexpr const char* kInvalidState = "INVALID_STATE";
inline constexpr const char* kInvalidArgument = "INVALID_ARGUMENT";
inline constexpr const char* kUnreachableCode = "UNREACHABLE_CODE";
inline constexpr const char* kNotImplemented = "NOT_IMPLEMENTED";
} // namespace error_code

/// Base of every exception thrown by tdtl. Carries the failing expression, the
/// source location of the throw site and a short error code, in addition to
/// the formatted message.
class TdtlException : public std::exception {
 public:
  TdtlException(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view errorSource,
      std::string_view errorCode);

  const char* what() const noexcept override {
    return what_.c_str();
  }

  const std::string& message() const {
    return message_;
  }

  const std::string& errorSource() const {
    return errorSource_;
  }

  const std::string& errorCode() const {
    return errorCode_;
  }

  const std::string& failingExpression() const {
    return failingExpression_;
  }

  const char* file() const {
    return file_;
  }

  size_t line() const {
    return line_;
  }

  const char* function() const {
    return function_;
  }

 private:
  const char* file_;
  size_t line_;
  const char* function_;
  std::string failingExpression_;
  std::string message_;
  std::string errorSource_;
  std::string errorCode_;
  std::string what_;
};

class TdtlUserError : public TdtlException {
 public:
  TdtlUserError(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view errorCode = error_code::kInvalidArgument)
      : TdtlException(
            file,
            line,
            function,
            failingExpression,
            message,
            error_source::kErrorSourceUser,
            errorCode) {}
};

class TdtlRuntimeError : public TdtlException {
 public:
  TdtlRuntimeError(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view errorCode = error_code::kInvalidState)
      : TdtlException(
            file,
            line,
            function,
            failingExpression,
            message,
            error_source::kErrorSourceRuntime,
            errorCode) {}
};

namespace detail {

inline std::string errorMessage() {
  return {};
}

inline std::string errorMessage(std::string_view message) {
  return std::string(message);
}

template <typename Arg, typename... Args>
std::string errorMessage(
    fmt::format_string<Arg, Args...> fmt,
    Arg&& arg,
    Args&&... args) {
  return fmt::format(
      fmt, std::forward<Arg>(arg), std::forward<Args>(args)...);
}

template <typename Exception>
[[noreturn]] void tdtlThrow(
    const char* file,
    size_t line,
    const char* function,
    std::string_view failingExpression,
    std::string message,
    std::string_view errorCode) {
  throw Exception(
      file, line, function, failingExpression, std::move(message), errorCode);
}

} // namespace detail
} // namespace facebook::tdtl

#define _TDTL_THROW(exception, expression, errorCode, ...) \
  ::facebook::tdtl::detail::tdtlThrow<exception>(          \
      __FILE__,                                            \
      __LINE__,                                            \
      __func__,                                            \
      expression,                                          \
      ::facebook::tdtl::detail::errorMessage(__VA_ARGS__), \
      errorCode)

#define _TDTL_CHECK_IMPL(exception, errorCode, expr, exprStr, ...) \
  if (__builtin_expect(!(expr), 0)) {                              \
    _TDTL_THROW(exception, exprStr, errorCode, ##__VA_ARGS__);     \
  }

#define TDTL_CHECK(expr, ...)                         \
  _TDTL_CHECK_IMPL(                                   \
      ::facebook::tdtl::TdtlRuntimeError,             \
      ::facebook::tdtl::error_code::kInvalidState,    \
      expr,                                           \
      #expr,                                          \
      ##__VA_ARGS__)

#define _TDTL_CHECK_OP(exception, errorCode, expr1, expr2, op, ...)        \
  do {                                                                     \
    const auto& _tdtlLhs = (expr1);                                        \
    const auto& _tdtlRhs = (expr2);                                        \
    _TDTL_CHECK_IMPL(                                                      \
        exception,                                                         \
        errorCode,                                                         \
        _tdtlLhs op _tdtlRhs,                                              \
        fmt::format("({} vs. {})", _tdtlLhs, _tdtlRhs) + " " #expr1        \
                                                         " " #op " " #expr2, \
        ##__VA_ARGS__);                                                    \
  } while (false)

#define TDTL_CHECK_EQ(e1, e2, ...)                   \
  _TDTL_CHECK_OP(                                    \
      ::facebook::tdtl::TdtlRuntimeError,            \
      ::facebook::tdtl::error_code::kInvalidState,   \
      e1,                                            \
      e2,                                            \
      ==,                                            \
      ##__VA_ARGS__)
#define TDTL_CHECK_NE(e1, e2, ...)                   \
  _TDTL_CHECK_OP(                                    \
      ::facebook::tdtl::TdtlRuntimeError,            \
      ::facebook::tdtl::error_code::kInvalidState,   \
      e1,                                            \
      e2,                                            \
      !=,                                            \
      ##__VA_ARGS__)
#define TDTL_CHECK_GT(e1, e2, ...)                   \
  _TDTL_CHECK_OP(                                    \
      ::facebook::tdtl::TdtlRuntimeError,            \
      ::facebook::tdtl::error_code::kInvalidState,   \
      e1,                                            \
      e2,                                            \
      >,                                             \
      ##__VA_ARGS__)
#define TDTL_CHECK_LT(e1, e2, ...)                   \
  _TDTL_CHECK_OP(                                    \
      ::facebook::tdtl::TdtlRuntimeError,            \
      ::facebook::tdtl::error_code::kInvalidState,   \
      e1,                                            \
      e2,                                            \
      <,                                             \
      ##__VA_ARGS__)

#define TDTL_CHECK_NOT_NULL(e, ...) \
  TDTL_CHECK((e) != nullptr, ##__VA_ARGS__)

#define TDTL_FAIL(...)                             \
  _TDTL_THROW(                                     \
      ::facebook::tdtl::TdtlRuntimeError,          \
      "",                                          \
      ::facebook::tdtl::error_code::kInvalidState, \
      ##__VA_ARGS__)

#define TDTL_UNREACHABLE(...)                         \
  _TDTL_THROW(                                        \
      ::facebook::tdtl::TdtlRuntimeError,             \
      "",                                             \
      ::facebook::tdtl::error_code::kUnreachableCode, \
      ##__VA_ARGS__)

#define TDTL_NYI(...)                                \
  _TDTL_THROW(                                       \
      ::facebook::tdtl::TdtlRuntimeError,            \
      "",                                            \
      ::facebook::tdtl::error_code::kNotImplemented, \
      ##__VA_ARGS__)

#define TDTL_USER_CHECK(expr, ...)                   \
  _TDTL_CHECK_IMPL(                                  \
      ::facebook::tdtl::TdtlUserError,               \
      ::facebook::tdtl::error_code::kInvalidArgument, \
      expr,                                          \
      #expr,                                         \
      ##__VA_ARGS__)

#define TDTL_USER_CHECK_GT(e1, e2, ...)                \
  _TDTL_CHECK_OP(                                      \
      ::facebook::tdtl::TdtlUserError,                 \
      ::facebook::tdtl::error_code::kInvalidArgument,  \
      e1,                                              \
      e2,                                              \
      >,                                               \
      ##__VA_ARGS__)
#define TDTL_USER_CHECK_LT(e1, e2, ...)                \
  _TDTL_CHECK_OP(                                      \
      ::facebook::tdtl::TdtlUserError,                 \
      ::facebook::tdtl::error_code::kInvalidArgument,  \
      e1,                                              \
      e2,                                              \
      <,                                               \
      ##__VA_ARGS__)

#define TDTL_USER_FAIL(...)                           \
  _TDTL_THROW(                                        \
      ::facebook::tdtl::TdtlUserError,                \
      "",                                             \
      ::facebook::tdtl::error_code::kInvalidArgument, \
      ##__VA_ARGS__)
