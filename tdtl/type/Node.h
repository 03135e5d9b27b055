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
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <folly/Conv.h>
#include <folly/dynamic.h>

#include "tdtl/common/Enums.h"
#include "tdtl/common/base/Exceptions.h"

namespace facebook::tdtl {

/// Kind of value held by a Node. kNumber is a logical category covering kInt
/// and kFloat: no Node ever reports it from kind(), but it is a valid
/// coercion target.
enum class NodeKind : int8_t {
  kUndefined = 0,
  kNull = 1,
  kBool = 2,
  kNumber = 3,
  kInt = 4,
  kFloat = 5,
  kString = 6,
  kArray = 7,
  kJson = 8,
};

TDTL_DECLARE_ENUM_NAME(NodeKind);

class Node;

namespace detail {
template <NodeKind KIND>
struct NodeKindTraits {};

template <>
struct NodeKindTraits<NodeKind::kBool> {
  using value_type = bool;
};

template <>
struct NodeKindTraits<NodeKind::kInt> {
  using value_type = int64_t;
};

template <>
struct NodeKindTraits<NodeKind::kFloat> {
  using value_type = double;
};

template <>
struct NodeKindTraits<NodeKind::kString> {
  using value_type = std::string;
};

template <>
struct NodeKindTraits<NodeKind::kArray> {
  using value_type = std::string;
};

template <>
struct NodeKindTraits<NodeKind::kJson> {
  using value_type = std::string;
};

template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T, typename = void>
struct IsRange : std::false_type {};

template <typename T>
struct IsRange<
    T,
    std::void_t<
        decltype(std::begin(std::declval<const T&>())),
        decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

template <typename T, typename = void>
struct IsMap : std::false_type {};

template <typename T>
struct IsMap<T, std::void_t<typename T::key_type, typename T::mapped_type>>
    : std::true_type {};

template <typename T, typename = void>
struct IsByteBuffer : std::false_type {};

// Contiguous containers of single bytes, e.g. std::vector<uint8_t>. These
// carry raw JSON text.
template <typename T>
struct IsByteBuffer<
    T,
    std::void_t<
        typename T::value_type,
        decltype(std::declval<const T&>().data()),
        decltype(std::declval<const T&>().size())>>
    : std::bool_constant<
          !std::is_convertible_v<const T&, std::string_view> &&
          (std::is_same_v<typename T::value_type, char> ||
           std::is_same_v<typename T::value_type, unsigned char> ||
           std::is_same_v<typename T::value_type, std::byte>)> {};

template <typename T>
inline constexpr bool isDereferenceable = std::is_pointer_v<T> &&
    !std::is_void_v<std::remove_pointer_t<T>> &&
    !std::is_function_v<std::remove_pointer_t<T>>;

// Decodes JSON text. Returns std::nullopt if the text is not valid JSON.
std::optional<folly::dynamic> parseJsonText(std::string_view text);

// Converts a value nested inside a container passed to Node::from(). Nested
// values follow the same rules as top-level ones: byte buffers and JSON nodes
// are decoded, and anything that would become Undefined makes the whole
// container Undefined (std::nullopt).
template <typename T>
std::optional<folly::dynamic> toDynamic(const T& value);
} // namespace detail

/// Node is an immutable, dynamically-typed value flowing through a query: a
/// literal in the query text, a field resolved out of a record, or the result
/// of evaluating an expression.
///
/// A Node is one of a closed set of kinds: Undefined, Null, Bool, Int, Float,
/// String, Array or JSON. Array and JSON nodes carry their payload as
/// serialized JSON text and only decode it on demand in value().
///
/// Conversions between kinds go through to(), which never throws. A
/// conversion that is not supported, or that fails on the content (e.g.
/// parsing "abc" as an Int), returns an Undefined node. Callers detect
/// failure by checking isUndefined().
///
/// Example:
///   auto n = Node::string("42");
///   n.to(NodeKind::kInt);      // Int 42
///   n.to(NodeKind::kNumber);   // Int 42, no '.' in the text
///   n.to(NodeKind::kJson);     // Undefined
class Node {
 public:
  /// Constructs an Undefined node.
  Node() : kind_{NodeKind::kUndefined} {}

  Node(const Node& other) = default;
  Node(Node&& other) noexcept = default;
  Node& operator=(const Node& other) = default;
  Node& operator=(Node&& other) noexcept = default;

  static Node undefined() {
    return Node();
  }

  static Node null() {
    return Node(NodeKind::kNull, std::monostate{});
  }

  static Node boolean(bool value) {
    return Node(NodeKind::kBool, value);
  }

  static Node integer(int64_t value) {
    return Node(NodeKind::kInt, value);
  }

  static Node floating(double value) {
    return Node(NodeKind::kFloat, value);
  }

  static Node string(std::string value) {
    return Node(NodeKind::kString, std::move(value));
  }

  /// 'value' is the serialized form of a JSON array, e.g. "[1,2]".
  static Node array(std::string value) {
    return Node(NodeKind::kArray, std::move(value));
  }

  /// 'value' is the serialized form of a JSON object or array.
  static Node json(std::string value) {
    return Node(NodeKind::kJson, std::move(value));
  }

  /// Creates a Node of the given kind. Useful when the kind is a template
  /// parameter, e.g. Node::create<NodeKind::kInt>(5).
  template <NodeKind KIND>
  static Node create(typename detail::NodeKindTraits<KIND>::value_type value) {
    return Node(KIND, std::move(value));
  }

  /// Creates a Node from a value produced by a generic JSON deserializer.
  /// Doubles become Float, integers become Int, strings become String,
  /// booleans become Bool, objects and arrays are re-serialized into a JSON
  /// node and null becomes Null.
  static Node create(const folly::dynamic& value);

  /// Creates a Node from a native C++ value. The kind is picked at compile
  /// time:
  ///   - bool: Bool
  ///   - floating point: Float
  ///   - any other integral type: Int, through its decimal text. Unsigned
  ///     values above the int64 range become Undefined.
  ///   - std::string, std::string_view, const char*: String
  ///   - contiguous byte buffers (std::vector<uint8_t>, std::vector<char>):
  ///     JSON, the bytes are taken as raw JSON text
  ///   - nullptr, std::nullopt, empty std::optional, null pointer (a null
  ///     const char* included): Null
  ///   - engaged std::optional, non-null pointer: dereferenced and converted
  ///   - maps with string keys and sequences of supported values: JSON. Each
  ///     element is converted by these same rules, so a nested byte buffer is
  ///     embedded as decoded JSON and a nested element that is not supported
  ///     (or is invalid JSON, or an Undefined node) makes the result Undefined
  ///   - folly::dynamic: same as create()
  ///   - Node: returned as is
  ///   - anything else, e.g. a lambda or a function: Undefined
  template <typename T>
  static Node from(const T& value);

  NodeKind kind() const {
    return kind_;
  }

  bool isUndefined() const {
    return kind_ == NodeKind::kUndefined;
  }

  bool isNull() const {
    return kind_ == NodeKind::kNull;
  }

  bool isNumber() const {
    return kind_ == NodeKind::kInt || kind_ == NodeKind::kFloat;
  }

  /// Returns the payload of a node of kind KIND. Throws if the node holds a
  /// different kind.
  template <NodeKind KIND>
  const typename detail::NodeKindTraits<KIND>::value_type& value() const {
    if (kind_ != KIND) {
      throwCheckKindError(KIND);
    }
    return std::get<typename detail::NodeKindTraits<KIND>::value_type>(
        payload_);
  }

  /// Returns the payload as a generic value. Undefined and Null map to null.
  /// Array and JSON nodes are decoded from their text on every call; text
  /// that is not valid JSON decodes to null.
  folly::dynamic value() const;

  /// Converts this node to 'target'. Never throws; returns an Undefined node
  /// if the conversion is not supported or fails.
  Node to(NodeKind target) const;

  /// Returns the canonical text form:
  ///   - Bool: "true" / "false"
  ///   - Int: decimal digits
  ///   - Float: fixed point with 6 fractional digits, e.g. "2.500000"
  ///   - String: the text, unquoted
  ///   - Null: "null"
  ///   - Array, JSON: the raw text
  ///   - Undefined: empty string
  std::string toString() const;

  uint64_t hash() const;

  bool operator==(const Node& other) const {
    return kind_ == other.kind_ && payload_ == other.payload_;
  }

  bool operator!=(const Node& other) const {
    return !(*this == other);
  }

  struct Hasher {
    size_t operator()(const Node& node) const {
      return node.hash();
    }
  };

 private:
  using Payload =
      std::variant<std::monostate, bool, int64_t, double, std::string>;

  Node(NodeKind kind, Payload payload)
      : kind_{kind}, payload_{std::move(payload)} {}

  // Parses decimal text into an Int node.
  static Node fromIntegerText(std::string_view text);

  Node boolTo(NodeKind target) const;
  Node intTo(NodeKind target) const;
  Node floatTo(NodeKind target) const;
  Node stringTo(NodeKind target) const;
  Node nullTo(NodeKind target) const;
  Node arrayTo(NodeKind target) const;
  Node jsonTo(NodeKind target) const;

  [[noreturn]] void throwCheckKindError(NodeKind expected) const;

  NodeKind kind_;
  Payload payload_;
};

std::ostream& operator<<(std::ostream& os, const Node& node);

namespace detail {

template <typename T>
std::optional<folly::dynamic> toDynamic(const T& value) {
  using U = std::remove_cv_t<T>;
  if constexpr (std::is_same_v<U, Node>) {
    switch (value.kind()) {
      case NodeKind::kUndefined:
        return std::nullopt;
      case NodeKind::kArray:
      case NodeKind::kJson:
        return parseJsonText(value.toString());
      default:
        return value.value();
    }
  } else if constexpr (std::is_same_v<U, folly::dynamic>) {
    return value;
  } else if constexpr (std::is_same_v<U, bool>) {
    return folly::dynamic(value);
  } else if constexpr (std::is_floating_point_v<U>) {
    return folly::dynamic(static_cast<double>(value));
  } else if constexpr (std::is_integral_v<U>) {
    auto converted = folly::tryTo<int64_t>(value);
    if (converted.hasError()) {
      return std::nullopt;
    }
    return folly::dynamic(converted.value());
  } else if constexpr (
      std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::nullopt_t>) {
    return folly::dynamic(nullptr);
  } else if constexpr (std::is_convertible_v<const U&, std::string_view>) {
    if constexpr (std::is_pointer_v<U>) {
      if (value == nullptr) {
        return folly::dynamic(nullptr);
      }
    }
    return folly::dynamic(std::string(std::string_view(value)));
  } else if constexpr (IsByteBuffer<U>::value) {
    return parseJsonText(std::string_view(
        reinterpret_cast<const char*>(value.data()), value.size()));
  } else if constexpr (IsOptional<U>::value) {
    if (!value.has_value()) {
      return folly::dynamic(nullptr);
    }
    return toDynamic(*value);
  } else if constexpr (isDereferenceable<U>) {
    if (value == nullptr) {
      return folly::dynamic(nullptr);
    }
    return toDynamic(*value);
  } else if constexpr (IsMap<U>::value) {
    if constexpr (std::is_convertible_v<
                      const typename U::key_type&,
                      std::string_view>) {
      folly::dynamic object = folly::dynamic::object;
      for (const auto& [key, element] : value) {
        auto converted = toDynamic(element);
        if (!converted.has_value()) {
          return std::nullopt;
        }
        object[std::string(std::string_view(key))] =
            std::move(converted.value());
      }
      return object;
    } else {
      return std::nullopt;
    }
  } else if constexpr (IsRange<U>::value) {
    folly::dynamic array = folly::dynamic::array;
    for (const auto& element : value) {
      auto converted = toDynamic(element);
      if (!converted.has_value()) {
        return std::nullopt;
      }
      array.push_back(std::move(converted.value()));
    }
    return array;
  } else {
    return std::nullopt;
  }
}

// Serializes containers with sorted object keys so the output does not depend
// on hash map iteration order.
std::string toJsonText(const folly::dynamic& value);

} // namespace detail

template <typename T>
Node Node::from(const T& value) {
  using U = std::remove_cv_t<T>;
  if constexpr (std::is_same_v<U, Node>) {
    return value;
  } else if constexpr (std::is_same_v<U, folly::dynamic>) {
    return create(value);
  } else if constexpr (std::is_same_v<U, bool>) {
    return boolean(value);
  } else if constexpr (std::is_floating_point_v<U>) {
    return floating(static_cast<double>(value));
  } else if constexpr (std::is_integral_v<U>) {
    // Widen first so that character types print as numbers.
    using Wide = std::conditional_t<std::is_signed_v<U>, int64_t, uint64_t>;
    return fromIntegerText(folly::to<std::string>(static_cast<Wide>(value)));
  } else if constexpr (
      std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::nullopt_t>) {
    return null();
  } else if constexpr (std::is_convertible_v<const U&, std::string_view>) {
    if constexpr (std::is_pointer_v<U>) {
      if (value == nullptr) {
        return null();
      }
    }
    return string(std::string(std::string_view(value)));
  } else if constexpr (detail::IsByteBuffer<U>::value) {
    const auto* bytes = reinterpret_cast<const char*>(value.data());
    return json(std::string(bytes, value.size()));
  } else if constexpr (detail::IsOptional<U>::value) {
    if (!value.has_value()) {
      return null();
    }
    return from(*value);
  } else if constexpr (detail::isDereferenceable<U>) {
    if (value == nullptr) {
      return null();
    }
    return from(*value);
  } else if constexpr (detail::IsMap<U>::value || detail::IsRange<U>::value) {
    auto dynamic = detail::toDynamic(value);
    if (!dynamic.has_value()) {
      return undefined();
    }
    return json(detail::toJsonText(dynamic.value()));
  } else {
    return undefined();
  }
}

} // namespace facebook::tdtl
