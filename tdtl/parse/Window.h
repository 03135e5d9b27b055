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

#include "tdtl/parse/IExpr.h"

namespace facebook::tdtl::parse {

/// Streaming window kinds.
enum class WindowType : int8_t {
  /// No windowing, every record is processed on its own.
  kNone,
  /// Fixed-size, non-overlapping windows. The interval equals the length.
  kTumbling,
  /// Fixed-size windows advancing by 'interval' < 'length', so consecutive
  /// windows overlap.
  kHopping,
  /// Windows re-evaluated on every event, covering the preceding 'length'.
  kSliding,
  /// Windows closed after 'interval' without events.
  kSession,
};

TDTL_DECLARE_ENUM_NAME(WindowType);

/// Window descriptor of a GROUP BY clause. This is configuration only:
/// assigning records to windows and firing them is up to the executor.
/// Length and interval are in the time unit of the query.
class WindowExpr : public IExpr {
 public:
  /// Does not validate the parameters. Prefer the factory methods below.
  WindowExpr(WindowType type, int64_t length, int64_t interval)
      : IExpr(ExprKind::kWindow),
        type_{type},
        length_{length},
        interval_{interval} {}

  WindowExpr(WindowExpr&&) = default;

  static WindowExpr tumbling(int64_t length);

  /// Requires 0 < interval < length.
  static WindowExpr hopping(int64_t length, int64_t interval);

  static WindowExpr sliding(int64_t length);

  /// 'length' caps the duration of a session, 'gap' is the inactivity period
  /// closing it.
  static WindowExpr session(int64_t length, int64_t gap);

  WindowType type() const {
    return type_;
  }

  int64_t length() const {
    return length_;
  }

  int64_t interval() const {
    return interval_;
  }

  /// True if a record can belong to more than one window.
  bool overlapping() const {
    return type_ == WindowType::kHopping || type_ == WindowType::kSliding;
  }

  std::vector<const IExpr*> inputs() const override {
    return {};
  }

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  WindowType type_;
  int64_t length_;
  int64_t interval_;
};

} // namespace facebook::tdtl::parse
