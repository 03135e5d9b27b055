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
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "tdtl/common/Enums.h"
#include "tdtl/common/base/Exceptions.h"

namespace facebook::tdtl::parse {

enum class ExprKind : int8_t {
  kConstant,
  kJsonPath,
  kBinary,
  kCall,
  kCase,
  kSwitch,
  kField,
  kFields,
  kTopic,
  kFilter,
  kWindow,
  kDimensions,
  kSelect,
};

TDTL_DECLARE_ENUM_NAME(ExprKind);

class IExpr;

/// Owning pointer to a child expression. Every node of a tree is owned by
/// exactly one parent.
using ExprPtr = std::unique_ptr<const IExpr>;

/// A node of a parsed query. Trees are built once by the parser and are
/// read-only afterwards, so they can be shared by concurrent evaluators.
class IExpr {
 public:
  explicit IExpr(ExprKind kind) : kind_{kind} {}

  virtual ~IExpr() = default;

  IExpr(const IExpr&) = delete;
  IExpr& operator=(const IExpr&) = delete;

  ExprKind kind() const {
    return kind_;
  }

  bool is(ExprKind kind) const {
    return kind_ == kind;
  }

  template <typename T>
  const T* as() const {
    return dynamic_cast<const T*>(this);
  }

  /// Returns the direct children in evaluation order. The pointers are owned
  /// by this node.
  virtual std::vector<const IExpr*> inputs() const = 0;

  virtual std::string toString() const = 0;

  bool operator==(const IExpr& other) const {
    return kind_ == other.kind_ && equals(other);
  }

  bool operator!=(const IExpr& other) const {
    return !(*this == other);
  }

  friend std::ostream& operator<<(std::ostream& os, const IExpr& obj) {
    return os << obj.toString();
  }

 protected:
  IExpr(IExpr&&) = default;

  // The actual equality comparison method to be specialized by subclasses.
  // 'other' is guaranteed to have the same kind.
  virtual bool equals(const IExpr& other) const = 0;

  // Compares the pointed-to expressions, not the pointers.
  static bool equal(
      const std::vector<ExprPtr>& a,
      const std::vector<ExprPtr>& b);

 private:
  ExprKind kind_;
};

/// Calls 'visitor' on 'expr' and then on every node below it, parents before
/// children, children in evaluation order.
void visitPreOrder(
    const IExpr& expr,
    const std::function<void(const IExpr&)>& visitor);

} // namespace facebook::tdtl::parse
