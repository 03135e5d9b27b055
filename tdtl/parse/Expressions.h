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

#include <optional>

#include "tdtl/parse/IExpr.h"
#include "tdtl/parse/Window.h"
#include "tdtl/type/Node.h"

namespace facebook::tdtl::parse {

/// A literal embedded in the query text.
class ConstantExpr : public IExpr {
 public:
  explicit ConstantExpr(Node value)
      : IExpr(ExprKind::kConstant), value_{std::move(value)} {}

  const Node& value() const {
    return value_;
  }

  std::vector<const IExpr*> inputs() const override {
    return {};
  }

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  Node value_;
};

/// Reference to a field of the current record. The path syntax is resolved
/// by the evaluator.
class JsonPathExpr : public IExpr {
 public:
  explicit JsonPathExpr(std::string path)
      : IExpr(ExprKind::kJsonPath), path_{std::move(path)} {}

  JsonPathExpr(JsonPathExpr&&) = default;

  const std::string& path() const {
    return path_;
  }

  std::vector<const IExpr*> inputs() const override {
    return {};
  }

  std::string toString() const override {
    return path_;
  }

 protected:
  bool equals(const IExpr& other) const override;

 private:
  std::string path_;
};

/// Binary operation. The operator is an opaque code assigned by the parser
/// and interpreted by the evaluator.
class BinaryExpr : public IExpr {
 public:
  BinaryExpr(int32_t op, ExprPtr left, ExprPtr right);

  int32_t op() const {
    return op_;
  }

  const IExpr& left() const {
    return *left_;
  }

  const IExpr& right() const {
    return *right_;
  }

  std::vector<const IExpr*> inputs() const override {
    return {left_.get(), right_.get()};
  }

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  int32_t op_;
  ExprPtr left_;
  ExprPtr right_;
};

/// Function call. The function is looked up by name when the query is
/// evaluated.
class CallExpr : public IExpr {
 public:
  /// @param rawText The call as written in the query. Used by toString() and
  /// in error messages.
  CallExpr(std::string rawText, std::string name, std::vector<ExprPtr> args);

  const std::string& rawText() const {
    return rawText_;
  }

  const std::string& name() const {
    return name_;
  }

  const std::vector<ExprPtr>& args() const {
    return args_;
  }

  std::vector<const IExpr*> inputs() const override;

  /// Returns the raw text. A call built without one (e.g. by a rewrite) is
  /// rendered as name(arg, ...).
  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  std::string rawText_;
  std::string name_;
  std::vector<ExprPtr> args_;
};

/// One WHEN ... THEN ... branch of a SwitchExpr.
class CaseExpr : public IExpr {
 public:
  CaseExpr(ExprPtr when, ExprPtr then);

  CaseExpr(CaseExpr&&) = default;

  const IExpr& when() const {
    return *when_;
  }

  const IExpr& then() const {
    return *then_;
  }

  std::vector<const IExpr*> inputs() const override {
    return {when_.get(), then_.get()};
  }

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  ExprPtr when_;
  ExprPtr then_;
};

/// CASE <subject> WHEN ... THEN ... [WHEN ... THEN ...] ELSE ... END
///
/// The evaluator evaluates 'subject', then returns the 'then' branch of the
/// first case whose 'when' matches it, or 'defaultBranch' if none does. Case
/// order is preserved as written.
class SwitchExpr : public IExpr {
 public:
  SwitchExpr(
      ExprPtr subject,
      std::vector<CaseExpr> cases,
      ExprPtr defaultBranch);

  const IExpr& subject() const {
    return *subject_;
  }

  const std::vector<CaseExpr>& cases() const {
    return cases_;
  }

  const IExpr& defaultBranch() const {
    return *defaultBranch_;
  }

  /// Returns the 'then' branch of the first case for which 'matches' returns
  /// true, or the default branch if there is none. Cases after the first
  /// match are not tested.
  const IExpr& selectBranch(
      const std::function<bool(const CaseExpr&)>& matches) const;

  /// Subject, cases in order, then the default branch.
  std::vector<const IExpr*> inputs() const override;

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  ExprPtr subject_;
  std::vector<CaseExpr> cases_;
  ExprPtr defaultBranch_;
};

/// A projected expression with an optional alias: <expr> [AS <alias>].
class FieldExpr : public IExpr {
 public:
  explicit FieldExpr(
      ExprPtr expr,
      std::optional<std::string> alias = std::nullopt);

  FieldExpr(FieldExpr&&) = default;

  const IExpr& expr() const {
    return *expr_;
  }

  const std::optional<std::string>& alias() const {
    return alias_;
  }

  std::vector<const IExpr*> inputs() const override {
    return {expr_.get()};
  }

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  ExprPtr expr_;
  std::optional<std::string> alias_;
};

/// The SELECT list, in output order.
class FieldsExpr : public IExpr {
 public:
  explicit FieldsExpr(std::vector<FieldExpr> fields)
      : IExpr(ExprKind::kFields), fields_{std::move(fields)} {}

  FieldsExpr(FieldsExpr&&) = default;

  const std::vector<FieldExpr>& fields() const {
    return fields_;
  }

  std::vector<const IExpr*> inputs() const override;

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  std::vector<FieldExpr> fields_;
};

/// The FROM clause: names of the topics records are read from.
class TopicExpr : public IExpr {
 public:
  explicit TopicExpr(std::vector<std::string> topics)
      : IExpr(ExprKind::kTopic), topics_{std::move(topics)} {}

  TopicExpr(TopicExpr&&) = default;

  const std::vector<std::string>& topics() const {
    return topics_;
  }

  std::vector<const IExpr*> inputs() const override {
    return {};
  }

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  std::vector<std::string> topics_;
};

/// The WHERE clause. 'expr' evaluates to a boolean.
class FilterExpr : public IExpr {
 public:
  explicit FilterExpr(ExprPtr expr);

  FilterExpr(FilterExpr&&) = default;

  const IExpr& expr() const {
    return *expr_;
  }

  std::vector<const IExpr*> inputs() const override {
    return {expr_.get()};
  }

  std::string toString() const override {
    return expr_->toString();
  }

 protected:
  bool equals(const IExpr& other) const override;

 private:
  ExprPtr expr_;
};

/// The GROUP BY clause: grouping keys and an optional window.
class DimensionsExpr : public IExpr {
 public:
  explicit DimensionsExpr(
      std::vector<JsonPathExpr> keys,
      std::optional<WindowExpr> window = std::nullopt)
      : IExpr(ExprKind::kDimensions),
        keys_{std::move(keys)},
        window_{std::move(window)} {}

  DimensionsExpr(DimensionsExpr&&) = default;

  const std::vector<JsonPathExpr>& keys() const {
    return keys_;
  }

  const std::optional<WindowExpr>& window() const {
    return window_;
  }

  /// Returns the window type, kNone if there is no window.
  WindowType windowType() const {
    return window_.has_value() ? window_->type() : WindowType::kNone;
  }

  /// Keys in order, then the window if any.
  std::vector<const IExpr*> inputs() const override;

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  std::vector<JsonPathExpr> keys_;
  std::optional<WindowExpr> window_;
};

/// Root of a parsed query:
///   SELECT <fields> FROM <topic> [WHERE <filter>] [GROUP BY <dimensions>]
class SelectStatementExpr : public IExpr {
 public:
  SelectStatementExpr(
      FieldsExpr fields,
      TopicExpr topic,
      std::optional<FilterExpr> filter = std::nullopt,
      std::optional<DimensionsExpr> dimensions = std::nullopt)
      : IExpr(ExprKind::kSelect),
        fields_{std::move(fields)},
        topic_{std::move(topic)},
        filter_{std::move(filter)},
        dimensions_{std::move(dimensions)} {}

  const FieldsExpr& fields() const {
    return fields_;
  }

  const TopicExpr& topic() const {
    return topic_;
  }

  const std::optional<FilterExpr>& filter() const {
    return filter_;
  }

  const std::optional<DimensionsExpr>& dimensions() const {
    return dimensions_;
  }

  std::vector<const IExpr*> inputs() const override;

  std::string toString() const override;

 protected:
  bool equals(const IExpr& other) const override;

 private:
  FieldsExpr fields_;
  TopicExpr topic_;
  std::optional<FilterExpr> filter_;
  std::optional<DimensionsExpr> dimensions_;
};

} // namespace facebook::tdtl::parse
