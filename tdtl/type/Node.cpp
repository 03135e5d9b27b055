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
#include "tdtl/type/Node.h"

#include <cctype>
#include <cmath>
#include <limits>

#include <fmt/format.h>
#include <folly/hash/Hash.h>
#include <folly/json.h>
#include <glog/logging.h>

#include "tdtl/flag_definitions/flags.h"

namespace facebook::tdtl {

namespace {
const auto& nodeKindNames() {
  static const folly::F14FastMap<NodeKind, std::string_view> kNames = {
      {NodeKind::kUndefined, "Undefined"},
      {NodeKind::kNull, "Null"},
      {NodeKind::kBool, "Bool"},
      {NodeKind::kNumber, "Number"},
      {NodeKind::kInt, "Int"},
      {NodeKind::kFloat, "Float"},
      {NodeKind::kString, "String"},
      {NodeKind::kArray, "Array"},
      {NodeKind::kJson, "JSON"},
  };
  return kNames;
}

// Numeric parsing must consume the whole text. folly::tryTo tolerates
// surrounding whitespace, which is not a valid number here.
bool hasSurroundingSpace(std::string_view text) {
  return text.empty() ||
      std::isspace(static_cast<unsigned char>(text.front())) ||
      std::isspace(static_cast<unsigned char>(text.back()));
}

std::optional<bool> parseBool(std::string_view text) {
  if (text == "1" || text == "t" || text == "T" || text == "TRUE" ||
      text == "true" || text == "True") {
    return true;
  }
  if (text == "0" || text == "f" || text == "F" || text == "FALSE" ||
      text == "false" || text == "False") {
    return false;
  }
  return std::nullopt;
}

Node coercionFailed(const Node& node, NodeKind target) {
  VLOG(2) << "Cannot coerce " << node << " to " << NodeKindName::toName(target);
  return Node::undefined();
}
} // namespace

TDTL_DEFINE_ENUM_NAME(NodeKind, nodeKindNames)

namespace detail {
std::optional<folly::dynamic> parseJsonText(std::string_view text) {
  try {
    return folly::parseJson(folly::StringPiece(text.data(), text.size()));
  } catch (const std::exception& e) {
    VLOG(1) << "Cannot decode JSON text: " << e.what();
    return std::nullopt;
  }
}

std::string toJsonText(const folly::dynamic& value) {
  folly::json::serialization_opts opts;
  opts.sort_keys = true;
  return folly::json::serialize(value, opts);
}
} // namespace detail

// static
Node Node::create(const folly::dynamic& value) {
  switch (value.type()) {
    case folly::dynamic::Type::NULLT:
      return null();
    case folly::dynamic::Type::BOOL:
      return boolean(value.getBool());
    case folly::dynamic::Type::INT64:
      return fromIntegerText(folly::to<std::string>(value.getInt()));
    case folly::dynamic::Type::DOUBLE:
      return floating(value.getDouble());
    case folly::dynamic::Type::STRING:
      return string(value.getString());
    case folly::dynamic::Type::ARRAY:
    case folly::dynamic::Type::OBJECT:
      return json(detail::toJsonText(value));
  }
  VLOG(1) << "Unsupported dynamic type: " << value.typeName();
  return undefined();
}

// static
Node Node::fromIntegerText(std::string_view text) {
  return string(std::string(text)).to(NodeKind::kInt);
}

folly::dynamic Node::value() const {
  switch (kind_) {
    case NodeKind::kUndefined:
    case NodeKind::kNull:
    case NodeKind::kNumber:
      return nullptr;
    case NodeKind::kBool:
      return std::get<bool>(payload_);
    case NodeKind::kInt:
      return std::get<int64_t>(payload_);
    case NodeKind::kFloat:
      return std::get<double>(payload_);
    case NodeKind::kString:
      return std::get<std::string>(payload_);
    case NodeKind::kArray:
    case NodeKind::kJson:
      return detail::parseJsonText(std::get<std::string>(payload_))
          .value_or(nullptr);
  }
  TDTL_UNREACHABLE();
}

Node Node::to(NodeKind target) const {
  switch (kind_) {
    case NodeKind::kUndefined:
    case NodeKind::kNumber:
      return undefined();
    case NodeKind::kNull:
      return nullTo(target);
    case NodeKind::kBool:
      return boolTo(target);
    case NodeKind::kInt:
      return intTo(target);
    case NodeKind::kFloat:
      return floatTo(target);
    case NodeKind::kString:
      return stringTo(target);
    case NodeKind::kArray:
      return arrayTo(target);
    case NodeKind::kJson:
      return jsonTo(target);
  }
  TDTL_UNREACHABLE();
}

Node Node::boolTo(NodeKind target) const {
  switch (target) {
    case NodeKind::kBool:
      return *this;
    case NodeKind::kString:
      return string(toString());
    default:
      return coercionFailed(*this, target);
  }
}

Node Node::intTo(NodeKind target) const {
  const auto value = std::get<int64_t>(payload_);
  switch (target) {
    case NodeKind::kNumber:
    case NodeKind::kInt:
      return *this;
    case NodeKind::kFloat:
      return floating(static_cast<double>(value));
    case NodeKind::kString:
      return string(toString());
    default:
      return coercionFailed(*this, target);
  }
}

Node Node::floatTo(NodeKind target) const {
  const auto value = std::get<double>(payload_);
  switch (target) {
    case NodeKind::kNumber:
    case NodeKind::kFloat:
      return *this;
    case NodeKind::kInt: {
      // 2^63 is exactly representable as a double, int64 max is not.
      static constexpr double kUpperBound = 9223372036854775808.0;
      static constexpr double kLowerBound = -9223372036854775808.0;
      if (std::isnan(value)) {
        return coercionFailed(*this, target);
      }
      if (value >= kUpperBound || value < kLowerBound) {
        if (!FLAGS_tdtl_float_to_int_saturate) {
          return coercionFailed(*this, target);
        }
        return integer(
            value > 0 ? std::numeric_limits<int64_t>::max()
                      : std::numeric_limits<int64_t>::min());
      }
      return integer(static_cast<int64_t>(value));
    }
    case NodeKind::kString:
      return string(toString());
    default:
      return coercionFailed(*this, target);
  }
}

Node Node::stringTo(NodeKind target) const {
  const auto& text = std::get<std::string>(payload_);
  switch (target) {
    case NodeKind::kString:
      return *this;
    case NodeKind::kBool: {
      auto parsed = parseBool(text);
      if (!parsed.has_value()) {
        return coercionFailed(*this, target);
      }
      return boolean(parsed.value());
    }
    case NodeKind::kNumber:
      // The decimal point in the text picks the parser, not the magnitude.
      if (text.find('.') == std::string::npos) {
        return stringTo(NodeKind::kInt);
      }
      return stringTo(NodeKind::kFloat);
    case NodeKind::kInt: {
      if (hasSurroundingSpace(text)) {
        return coercionFailed(*this, target);
      }
      auto parsed = folly::tryTo<int64_t>(text);
      if (parsed.hasError()) {
        return coercionFailed(*this, target);
      }
      return integer(parsed.value());
    }
    case NodeKind::kFloat: {
      if (hasSurroundingSpace(text)) {
        return coercionFailed(*this, target);
      }
      auto parsed = folly::tryTo<double>(text);
      if (parsed.hasError()) {
        return coercionFailed(*this, target);
      }
      return floating(parsed.value());
    }
    default:
      return coercionFailed(*this, target);
  }
}

Node Node::nullTo(NodeKind target) const {
  switch (target) {
    case NodeKind::kNull:
      return *this;
    case NodeKind::kJson:
      return json("{}");
    case NodeKind::kArray:
      return array("[]");
    default:
      return coercionFailed(*this, target);
  }
}

Node Node::arrayTo(NodeKind target) const {
  const auto& text = std::get<std::string>(payload_);
  switch (target) {
    case NodeKind::kArray:
      return *this;
    case NodeKind::kString:
      return string(text);
    case NodeKind::kJson:
      return json(text);
    default:
      return coercionFailed(*this, target);
  }
}

Node Node::jsonTo(NodeKind target) const {
  if (target == NodeKind::kJson) {
    return *this;
  }
  return coercionFailed(*this, target);
}

std::string Node::toString() const {
  switch (kind_) {
    case NodeKind::kUndefined:
    case NodeKind::kNumber:
      return "";
    case NodeKind::kNull:
      return "null";
    case NodeKind::kBool:
      return std::get<bool>(payload_) ? "true" : "false";
    case NodeKind::kInt:
      return fmt::format("{}", std::get<int64_t>(payload_));
    case NodeKind::kFloat:
      return fmt::format("{:f}", std::get<double>(payload_));
    case NodeKind::kString:
    case NodeKind::kArray:
    case NodeKind::kJson:
      return std::get<std::string>(payload_);
  }
  TDTL_UNREACHABLE();
}

uint64_t Node::hash() const {
  const auto kindHash = folly::hasher<int8_t>{}(static_cast<int8_t>(kind_));
  return std::visit(
      [&](const auto& payload) -> uint64_t {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return kindHash;
        } else {
          return folly::hash::hash_combine(kindHash, payload);
        }
      },
      payload_);
}

void Node::throwCheckKindError(NodeKind expected) const {
  TDTL_USER_FAIL(
      "Wrong node kind: expected {}, got {}",
      NodeKindName::toName(expected),
      NodeKindName::toName(kind_));
}

std::ostream& operator<<(std::ostream& os, const Node& node) {
  os << NodeKindName::toName(node.kind());
  if (node.isUndefined() || node.isNull()) {
    return os;
  }
  return os << "(" << node.toString() << ")";
}

} // namespace facebook::tdtl
