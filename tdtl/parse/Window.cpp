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
#include "tdtl/parse/Window.h"

#include <fmt/format.h>

namespace facebook::tdtl::parse {

namespace {
const auto& windowTypeNames() {
  static const folly::F14FastMap<WindowType, std::string_view> kNames = {
      {WindowType::kNone, "NONE"},
      {WindowType::kTumbling, "TUMBLING"},
      {WindowType::kHopping, "HOPPING"},
      {WindowType::kSliding, "SLIDING"},
      {WindowType::kSession, "SESSION"},
  };
  return kNames;
}
} // namespace

TDTL_DEFINE_ENUM_NAME(WindowType, windowTypeNames)

// static
WindowExpr WindowExpr::tumbling(int64_t length) {
  TDTL_USER_CHECK_GT(length, 0, "Window length must be positive");
  return WindowExpr(WindowType::kTumbling, length, length);
}

// static
WindowExpr WindowExpr::hopping(int64_t length, int64_t interval) {
  TDTL_USER_CHECK_GT(length, 0, "Window length must be positive");
  TDTL_USER_CHECK_GT(interval, 0, "Hopping interval must be positive");
  TDTL_USER_CHECK_LT(
      interval,
      length,
      "Hopping interval must be shorter than the window length");
  return WindowExpr(WindowType::kHopping, length, interval);
}

// static
WindowExpr WindowExpr::sliding(int64_t length) {
  TDTL_USER_CHECK_GT(length, 0, "Window length must be positive");
  return WindowExpr(WindowType::kSliding, length, 0);
}

// static
WindowExpr WindowExpr::session(int64_t length, int64_t gap) {
  TDTL_USER_CHECK_GT(length, 0, "Window length must be positive");
  TDTL_USER_CHECK_GT(gap, 0, "Session gap must be positive");
  return WindowExpr(WindowType::kSession, length, gap);
}

std::string WindowExpr::toString() const {
  switch (type_) {
    case WindowType::kNone:
      return "NOWINDOW";
    case WindowType::kTumbling:
    case WindowType::kSliding:
      return fmt::format(
          "{}WINDOW({})", WindowTypeName::toName(type_), length_);
    case WindowType::kHopping:
    case WindowType::kSession:
      return fmt::format(
          "{}WINDOW({}, {})",
          WindowTypeName::toName(type_),
          length_,
          interval_);
  }
  TDTL_UNREACHABLE();
}

bool WindowExpr::equals(const IExpr& other) const {
  const auto* otherWindow = other.as<WindowExpr>();
  return type_ == otherWindow->type_ && length_ == otherWindow->length_ &&
      interval_ == otherWindow->interval_;
}

} // namespace facebook::tdtl::parse
