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
#include "tdtl/parse/Expressions.h"

#include <algorithm>

#include <boost/algorithm/string/replace.hpp>
#include <fmt/format.h>
#include <folly/String.h>

namespace facebook::tdtl::parse {

namespace {
const auto& exprKindNames() {
  static const folly::F14FastMap<ExprKind, std::string_view> kNames = {
      {ExprKind::kConstant, "Constant"},
      {ExprKind::kJsonPath, "JsonPath"},
      {ExprKind::kBinary, "Binary"},
      {ExprKind::kCall, "Call"},
      {ExprKind::kCase, "Case"},
      {ExprKind::kSwitch, "Switch"},
      {ExprKind::kField, "Field"},
      {ExprKind::kFields, "Fields"},
      {ExprKind::kTopic, "Topic"},
      {ExprKind::kFilter, "Filter"},
      {ExprKind::kWindow, "Window"},
      {ExprKind::kDimensions, "Dimensions"},
      {ExprKind::kSelect, "Select"},
  };
  return kNames;
}

template <typename T>
std::string joinToString(const std::vector<T>& exprs) {
  std::vector<std::string> parts;
  parts.reserve(exprs.size());
  for (const auto& expr : exprs) {
    parts.push_back(expr.toString());
  }
  return folly::join(", ", parts);
}
} // namespace

TDTL_DEFINE_ENUM_NAME(ExprKind, exprKindNames)

// static
bool IExpr::equal(
    const std::vector<ExprPtr>& a,
    const std::vector<ExprPtr>& b) {
  return std::equal(
      a.begin(),
      a.end(),
      b.begin(),
      b.end(),
      [](const ExprPtr& item1, const ExprPtr& item2) -> bool {
        return *item1 == *item2;
      });
}

void visitPreOrder(
    const IExpr& expr,
    const std::function<void(const IExpr&)>& visitor) {
  visitor(expr);
  for (const auto* input : expr.inputs()) {
    visitPreOrder(*input, visitor);
  }
}

std::string ConstantExpr::toString() const {
  switch (value_.kind()) {
    case NodeKind::kString:
      return fmt::format(
          "'{}'",
          boost::algorithm::replace_all_copy(value_.toString(), "'", "''"));
    case NodeKind::kUndefined:
      return "undefined";
    default:
      return value_.toString();
  }
}

bool ConstantExpr::equals(const IExpr& other) const {
  return value_ == other.as<ConstantExpr>()->value_;
}

bool JsonPathExpr::equals(const IExpr& other) const {
  return path_ == other.as<JsonPathExpr>()->path_;
}

BinaryExpr::BinaryExpr(int32_t op, ExprPtr left, ExprPtr right)
    : IExpr(ExprKind::kBinary),
      op_{op},
      left_{std::move(left)},
      right_{std::move(right)} {
  TDTL_CHECK_NOT_NULL(left_, "Binary expression requires a left operand");
  TDTL_CHECK_NOT_NULL(right_, "Binary expression requires a right operand");
}

std::string BinaryExpr::toString() const {
  return fmt::format(
      "({} <{}> {})", left_->toString(), op_, right_->toString());
}

bool BinaryExpr::equals(const IExpr& other) const {
  const auto* otherBinary = other.as<BinaryExpr>();
  return op_ == otherBinary->op_ && *left_ == *otherBinary->left_ &&
      *right_ == *otherBinary->right_;
}

CallExpr::CallExpr(
    std::string rawText,
    std::string name,
    std::vector<ExprPtr> args)
    : IExpr(ExprKind::kCall),
      rawText_{std::move(rawText)},
      name_{std::move(name)},
      args_{std::move(args)} {
  for (const auto& arg : args_) {
    TDTL_CHECK_NOT_NULL(arg, "Null argument in call to {}", name_);
  }
}

std::vector<const IExpr*> CallExpr::inputs() const {
  std::vector<const IExpr*> inputs;
  inputs.reserve(args_.size());
  for (const auto& arg : args_) {
    inputs.push_back(arg.get());
  }
  return inputs;
}

std::string CallExpr::toString() const {
  if (!rawText_.empty()) {
    return rawText_;
  }
  std::vector<std::string> args;
  args.reserve(args_.size());
  for (const auto& arg : args_) {
    args.push_back(arg->toString());
  }
  return fmt::format("{}({})", name_, folly::join(", ", args));
}

bool CallExpr::equals(const IExpr& other) const {
  const auto* otherCall = other.as<CallExpr>();
  return name_ == otherCall->name_ && rawText_ == otherCall->rawText_ &&
      equal(args_, otherCall->args_);
}

CaseExpr::CaseExpr(ExprPtr when, ExprPtr then)
    : IExpr(ExprKind::kCase), when_{std::move(when)}, then_{std::move(then)} {
  TDTL_CHECK_NOT_NULL(when_, "Case requires a WHEN expression");
  TDTL_CHECK_NOT_NULL(then_, "Case requires a THEN expression");
}

std::string CaseExpr::toString() const {
  return fmt::format("WHEN {} THEN {}", when_->toString(), then_->toString());
}

bool CaseExpr::equals(const IExpr& other) const {
  const auto* otherCase = other.as<CaseExpr>();
  return *when_ == *otherCase->when_ && *then_ == *otherCase->then_;
}

SwitchExpr::SwitchExpr(
    ExprPtr subject,
    std::vector<CaseExpr> cases,
    ExprPtr defaultBranch)
    : IExpr(ExprKind::kSwitch),
      subject_{std::move(subject)},
      cases_{std::move(cases)},
      defaultBranch_{std::move(defaultBranch)} {
  TDTL_CHECK_NOT_NULL(subject_, "Switch requires a subject");
  TDTL_CHECK_NOT_NULL(defaultBranch_, "Switch requires a default branch");
}

const IExpr& SwitchExpr::selectBranch(
    const std::function<bool(const CaseExpr&)>& matches) const {
  for (const auto& caseExpr : cases_) {
    if (matches(caseExpr)) {
      return caseExpr.then();
    }
  }
  return *defaultBranch_;
}

std::vector<const IExpr*> SwitchExpr::inputs() const {
  std::vector<const IExpr*> inputs;
  inputs.reserve(cases_.size() + 2);
  inputs.push_back(subject_.get());
  for (const auto& caseExpr : cases_) {
    inputs.push_back(&caseExpr);
  }
  inputs.push_back(defaultBranch_.get());
  return inputs;
}

std::string SwitchExpr::toString() const {
  std::string out = fmt::format("CASE {}", subject_->toString());
  for (const auto& caseExpr : cases_) {
    out += " " + caseExpr.toString();
  }
  out += fmt::format(" ELSE {} END", defaultBranch_->toString());
  return out;
}

bool SwitchExpr::equals(const IExpr& other) const {
  const auto* otherSwitch = other.as<SwitchExpr>();
  if (*subject_ != *otherSwitch->subject_ ||
      *defaultBranch_ != *otherSwitch->defaultBranch_ ||
      cases_.size() != otherSwitch->cases_.size()) {
    return false;
  }
  for (size_t i = 0; i < cases_.size(); ++i) {
    if (cases_[i] != otherSwitch->cases_[i]) {
      return false;
    }
  }
  return true;
}

FieldExpr::FieldExpr(ExprPtr expr, std::optional<std::string> alias)
    : IExpr(ExprKind::kField),
      expr_{std::move(expr)},
      alias_{std::move(alias)} {
  TDTL_CHECK_NOT_NULL(expr_, "Field requires an expression");
}

std::string FieldExpr::toString() const {
  if (!alias_.has_value()) {
    return expr_->toString();
  }
  return fmt::format("{} AS {}", expr_->toString(), alias_.value());
}

bool FieldExpr::equals(const IExpr& other) const {
  const auto* otherField = other.as<FieldExpr>();
  return alias_ == otherField->alias_ && *expr_ == *otherField->expr_;
}

std::vector<const IExpr*> FieldsExpr::inputs() const {
  std::vector<const IExpr*> inputs;
  inputs.reserve(fields_.size());
  for (const auto& field : fields_) {
    inputs.push_back(&field);
  }
  return inputs;
}

std::string FieldsExpr::toString() const {
  return joinToString(fields_);
}

bool FieldsExpr::equals(const IExpr& other) const {
  const auto& otherFields = other.as<FieldsExpr>()->fields_;
  if (fields_.size() != otherFields.size()) {
    return false;
  }
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i] != otherFields[i]) {
      return false;
    }
  }
  return true;
}

std::string TopicExpr::toString() const {
  return folly::join(", ", topics_);
}

bool TopicExpr::equals(const IExpr& other) const {
  return topics_ == other.as<TopicExpr>()->topics_;
}

FilterExpr::FilterExpr(ExprPtr expr)
    : IExpr(ExprKind::kFilter), expr_{std::move(expr)} {
  TDTL_CHECK_NOT_NULL(expr_, "Filter requires an expression");
}

bool FilterExpr::equals(const IExpr& other) const {
  return *expr_ == *other.as<FilterExpr>()->expr_;
}

std::vector<const IExpr*> DimensionsExpr::inputs() const {
  std::vector<const IExpr*> inputs;
  inputs.reserve(keys_.size() + 1);
  for (const auto& key : keys_) {
    inputs.push_back(&key);
  }
  if (window_.has_value()) {
    inputs.push_back(&window_.value());
  }
  return inputs;
}

std::string DimensionsExpr::toString() const {
  auto out = joinToString(keys_);
  if (window_.has_value()) {
    if (!out.empty()) {
      out += ", ";
    }
    out += window_->toString();
  }
  return out;
}

bool DimensionsExpr::equals(const IExpr& other) const {
  const auto* otherDimensions = other.as<DimensionsExpr>();
  if (keys_.size() != otherDimensions->keys_.size() ||
      window_.has_value() != otherDimensions->window_.has_value()) {
    return false;
  }
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] != otherDimensions->keys_[i]) {
      return false;
    }
  }
  return !window_.has_value() || *window_ == *otherDimensions->window_;
}

std::vector<const IExpr*> SelectStatementExpr::inputs() const {
  std::vector<const IExpr*> inputs{&fields_, &topic_};
  if (filter_.has_value()) {
    inputs.push_back(&filter_.value());
  }
  if (dimensions_.has_value()) {
    inputs.push_back(&dimensions_.value());
  }
  return inputs;
}

std::string SelectStatementExpr::toString() const {
  auto out =
      fmt::format("SELECT {} FROM {}", fields_.toString(), topic_.toString());
  if (filter_.has_value()) {
    out += fmt::format(" WHERE {}", filter_->toString());
  }
  if (dimensions_.has_value()) {
    out += fmt::format(" GROUP BY {}", dimensions_->toString());
  }
  return out;
}

bool SelectStatementExpr::equals(const IExpr& other) const {
  const auto* otherSelect = other.as<SelectStatementExpr>();
  if (fields_ != otherSelect->fields_ || topic_ != otherSelect->topic_) {
    return false;
  }
  if (filter_.has_value() != otherSelect->filter_.has_value() ||
      (filter_.has_value() && *filter_ != *otherSelect->filter_)) {
    return false;
  }
  if (dimensions_.has_value() != otherSelect->dimensions_.has_value() ||
      (dimensions_.has_value() && *dimensions_ != *otherSelect->dimensions_)) {
    return false;
  }
  return true;
}

} // namespace facebook::tdtl::parse
