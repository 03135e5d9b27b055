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
#include <ostream>
#include <string_view>

#include <folly/container/F14Map.h>

#include "tdtl/common/base/Exceptions.h"

/// Declares a helper struct <EnumType>Name with conversions between the enum
/// values and their printable names, plus a stream operator. Place next to
/// the enum declaration in a header.
///
///   enum class Foo { kA, kB };
///   TDTL_DECLARE_ENUM_NAME(Foo);
///
///   FooName::toName(Foo::kA);   // "A"
///   FooName::toFoo("B");        // Foo::kB
///   FooName::tryToFoo("C");     // std::nullopt
#define TDTL_DECLARE_ENUM_NAME(EnumType)                                \
  struct EnumType##Name {                                               \
    static std::string_view toName(EnumType value);                     \
    static EnumType to##EnumType(std::string_view name);                \
    static std::optional<EnumType> tryTo##EnumType(std::string_view name); \
  };                                                                    \
  std::ostream& operator<<(std::ostream& os, const EnumType& value)

/// Defines the functions declared by TDTL_DECLARE_ENUM_NAME. 'Names' is a
/// function returning a map from each enum value to its name. Place in the
/// .cpp file, in the same namespace as the declaration.
#define TDTL_DEFINE_ENUM_NAME(EnumType, Names)                              \
  std::string_view EnumType##Name::toName(EnumType value) {                 \
    const auto& names = Names();                                            \
    auto it = names.find(value);                                            \
    TDTL_CHECK(                                                             \
        it != names.end(),                                                  \
        "Invalid enum value: {}",                                           \
        static_cast<int>(value));                                           \
    return it->second;                                                      \
  }                                                                         \
                                                                            \
  std::optional<EnumType> EnumType##Name::tryTo##EnumType(                  \
      std::string_view name) {                                              \
    for (const auto& [value, valueName] : Names()) {                        \
      if (valueName == name) {                                              \
        return value;                                                       \
      }                                                                     \
    }                                                                       \
    return std::nullopt;                                                    \
  }                                                                         \
                                                                            \
  EnumType EnumType##Name::to##EnumType(std::string_view name) {            \
    auto value = tryTo##EnumType(name);                                     \
    TDTL_USER_CHECK(                                                        \
        value.has_value(), "Invalid enum name: {}", std::string(name));     \
    return value.value();                                                   \
  }                                                                         \
                                                                            \
  std::ostream& operator<<(std::ostream& os, const EnumType& value) {       \
    return os << EnumType##Name::toName(value);                             \
  }
