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

#include <string>
#include <string_view>

#include "tdtl/common/base/Status.h"
#include "tdtl/type/Node.h"

/// Textual patching of JSON documents. The document is never fully decoded:
/// the scanner walks the top-level object only as far as the target key and
/// splices the new value text in place of the old one, so every other byte
/// (key order, whitespace, number formatting) is preserved.
namespace facebook::tdtl::json {

/// Byte range [begin, end) of a value inside a document.
struct ValueSpan {
  size_t begin;
  size_t end;

  size_t size() const {
    return end - begin;
  }

  bool operator==(const ValueSpan& other) const {
    return begin == other.begin && end == other.end;
  }
};

/// Locates the value of top-level member 'key' in 'document', which must be a
/// JSON object. Keys are compared after decoding escape sequences. If the key
/// occurs more than once the first occurrence wins.
///
/// Fails with a KeyError status if the object has no such member, and with an
/// Invalid status if the text before the value is not a well-formed JSON
/// object.
Expected<ValueSpan> findValue(std::string_view document, std::string_view key);

/// Returns a copy of 'document' where the value of top-level member 'key' is
/// replaced by 'value':
///   - Int, Float, Bool: inserted unquoted using their canonical text.
///   - String: inserted between double quotes. The text is not escaped; the
///     caller guarantees it is a valid JSON string body.
///   - JSON: inserted verbatim. With an empty 'key' the whole document is
///     replaced by the value's text.
///
/// Any other kind of 'value' (Undefined, Null, Array) fails with a TypeError
/// status. See findValue() for errors locating the key.
Expected<std::string>
update(std::string_view document, std::string_view key, const Node& value);

/// Same as above, for a document held in a JSON node. Fails with a TypeError
/// status if 'document' is not a JSON node.
Expected<std::string>
update(const Node& document, std::string_view key, const Node& value);

/// Returns the form 'node' takes when embedded into a larger JSON document:
/// JSON nodes as their raw text, String nodes between double quotes and every
/// other kind as its toString().
std::string toWireBytes(const Node& node);

} // namespace facebook::tdtl::json
