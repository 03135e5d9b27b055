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
#include "tdtl/json/JsonUpdate.h"

#include <glog/logging.h>

#include "tdtl/flag_definitions/flags.h"

namespace facebook::tdtl::json {

namespace {

// Walks the members of the top-level object of a JSON document. Only the
// structure needed to step over values is checked; values are not decoded.
class TopLevelScanner {
 public:
  explicit TopLevelScanner(std::string_view document) : document_(document) {}

  Expected<ValueSpan> find(std::string_view key);

 private:
  bool hasNextCharacter() const {
    return index_ < document_.size();
  }

  char peekCharacter() const {
    return document_[index_];
  }

  bool tryMatch(char expected) {
    if (!hasNextCharacter() || peekCharacter() != expected) {
      return false;
    }
    index_++;
    return true;
  }

  void skipWhitespace() {
    while (hasNextCharacter()) {
      auto c = peekCharacter();
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        break;
      }
      index_++;
    }
  }

  Status invalid(std::string_view reason) const {
    return Status::Invalid(
        "Malformed JSON document at offset {}: {}", index_, reason);
  }

  // Reads a string starting at the opening quote. If 'decoded' is not null,
  // the unescaped contents are appended to it.
  Status readString(std::string* decoded);

  Status readEscape(std::string* decoded);

  Status readHex4(uint32_t& codePoint);

  Status skipValue(int32_t depth);

  Status skipObject(int32_t depth);

  Status skipArray(int32_t depth);

  Status skipLiteral();

  const std::string_view document_;
  size_t index_{0};
};

void appendUtf8(uint32_t codePoint, std::string& out) {
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
}

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

bool isLiteralCharacter(char c) {
  return isDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      c == '-' || c == '+' || c == '.';
}

// Matches the JSON number grammar:
//   -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
bool isJsonNumber(std::string_view token) {
  size_t i = 0;
  auto digits = [&]() {
    const auto begin = i;
    while (i < token.size() && isDigit(token[i])) {
      i++;
    }
    return i - begin;
  };

  if (i < token.size() && token[i] == '-') {
    i++;
  }
  if (i < token.size() && token[i] == '0') {
    i++;
  } else if (digits() == 0) {
    return false;
  }
  if (i < token.size() && token[i] == '.') {
    i++;
    if (digits() == 0) {
      return false;
    }
  }
  if (i < token.size() && (token[i] == 'e' || token[i] == 'E')) {
    i++;
    if (i < token.size() && (token[i] == '+' || token[i] == '-')) {
      i++;
    }
    if (digits() == 0) {
      return false;
    }
  }
  return i == token.size();
}

bool isValidLiteral(std::string_view token) {
  return token == "true" || token == "false" || token == "null" ||
      isJsonNumber(token);
}

Expected<ValueSpan> TopLevelScanner::find(std::string_view key) {
  skipWhitespace();
  if (!tryMatch('{')) {
    return folly::makeUnexpected(invalid("expected '{'"));
  }
  skipWhitespace();
  if (tryMatch('}')) {
    return folly::makeUnexpected(Status::KeyError("Key not found: {}", key));
  }

  std::string name;
  while (true) {
    skipWhitespace();
    name.clear();
    auto status = readString(&name);
    if (!status.ok()) {
      return folly::makeUnexpected(std::move(status));
    }
    skipWhitespace();
    if (!tryMatch(':')) {
      return folly::makeUnexpected(invalid("expected ':'"));
    }
    skipWhitespace();

    const auto begin = index_;
    status = skipValue(1);
    if (!status.ok()) {
      return folly::makeUnexpected(std::move(status));
    }
    if (name == key) {
      return ValueSpan{begin, index_};
    }

    skipWhitespace();
    if (tryMatch(',')) {
      continue;
    }
    if (tryMatch('}')) {
      break;
    }
    return folly::makeUnexpected(invalid("expected ',' or '}'"));
  }

  return folly::makeUnexpected(Status::KeyError("Key not found: {}", key));
}

Status TopLevelScanner::readString(std::string* decoded) {
  if (!tryMatch('"')) {
    return invalid("expected '\"'");
  }
  while (hasNextCharacter()) {
    auto c = peekCharacter();
    index_++;
    if (c == '"') {
      return Status::OK();
    }
    if (c == '\\') {
      auto status = readEscape(decoded);
      if (!status.ok()) {
        return status;
      }
      continue;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return invalid("control character in string");
    }
    if (decoded != nullptr) {
      decoded->push_back(c);
    }
  }
  return invalid("unterminated string");
}

Status TopLevelScanner::readEscape(std::string* decoded) {
  if (!hasNextCharacter()) {
    return invalid("unterminated escape sequence");
  }
  auto c = peekCharacter();
  index_++;
  char unescaped;
  switch (c) {
    case '"':
    case '\\':
    case '/':
      unescaped = c;
      break;
    case 'b':
      unescaped = '\b';
      break;
    case 'f':
      unescaped = '\f';
      break;
    case 'n':
      unescaped = '\n';
      break;
    case 'r':
      unescaped = '\r';
      break;
    case 't':
      unescaped = '\t';
      break;
    case 'u': {
      uint32_t codePoint;
      auto status = readHex4(codePoint);
      if (!status.ok()) {
        return status;
      }
      // A high surrogate followed by an escaped low surrogate forms a single
      // code point.
      if (codePoint >= 0xD800 && codePoint <= 0xDBFF &&
          document_.substr(index_, 2) == "\\u") {
        index_ += 2;
        uint32_t low;
        status = readHex4(low);
        if (!status.ok()) {
          return status;
        }
        if (low >= 0xDC00 && low <= 0xDFFF) {
          codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
        } else if (decoded != nullptr) {
          appendUtf8(codePoint, *decoded);
          codePoint = low;
        }
      }
      if (decoded != nullptr) {
        appendUtf8(codePoint, *decoded);
      }
      return Status::OK();
    }
    default:
      return invalid("invalid escape sequence");
  }
  if (decoded != nullptr) {
    decoded->push_back(unescaped);
  }
  return Status::OK();
}

Status TopLevelScanner::readHex4(uint32_t& codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    if (!hasNextCharacter()) {
      return invalid("truncated unicode escape");
    }
    auto c = peekCharacter();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      return invalid("invalid unicode escape");
    }
    codePoint = (codePoint << 4) | digit;
    index_++;
  }
  return Status::OK();
}

Status TopLevelScanner::skipValue(int32_t depth) {
  if (depth > FLAGS_tdtl_json_update_max_depth) {
    return invalid(fmt::format(
        "nesting exceeds maximum depth of {}",
        FLAGS_tdtl_json_update_max_depth));
  }
  if (!hasNextCharacter()) {
    return invalid("unexpected end of document");
  }
  switch (peekCharacter()) {
    case '"':
      return readString(nullptr);
    case '{':
      return skipObject(depth);
    case '[':
      return skipArray(depth);
    default:
      return skipLiteral();
  }
}

Status TopLevelScanner::skipObject(int32_t depth) {
  index_++;
  skipWhitespace();
  if (tryMatch('}')) {
    return Status::OK();
  }
  while (true) {
    skipWhitespace();
    auto status = readString(nullptr);
    if (!status.ok()) {
      return status;
    }
    skipWhitespace();
    if (!tryMatch(':')) {
      return invalid("expected ':'");
    }
    skipWhitespace();
    status = skipValue(depth + 1);
    if (!status.ok()) {
      return status;
    }
    skipWhitespace();
    if (tryMatch(',')) {
      continue;
    }
    if (tryMatch('}')) {
      return Status::OK();
    }
    return invalid("expected ',' or '}'");
  }
}

Status TopLevelScanner::skipArray(int32_t depth) {
  index_++;
  skipWhitespace();
  if (tryMatch(']')) {
    return Status::OK();
  }
  while (true) {
    skipWhitespace();
    auto status = skipValue(depth + 1);
    if (!status.ok()) {
      return status;
    }
    skipWhitespace();
    if (tryMatch(',')) {
      continue;
    }
    if (tryMatch(']')) {
      return Status::OK();
    }
    return invalid("expected ',' or ']'");
  }
}

Status TopLevelScanner::skipLiteral() {
  const auto begin = index_;
  while (hasNextCharacter() && isLiteralCharacter(peekCharacter())) {
    index_++;
  }
  if (!isValidLiteral(document_.substr(begin, index_ - begin))) {
    index_ = begin;
    return invalid("unexpected token");
  }
  return Status::OK();
}

} // namespace

Expected<ValueSpan> findValue(std::string_view document, std::string_view key) {
  return TopLevelScanner(document).find(key);
}

Expected<std::string>
update(std::string_view document, std::string_view key, const Node& value) {
  std::string replacement;
  switch (value.kind()) {
    case NodeKind::kInt:
    case NodeKind::kFloat:
    case NodeKind::kBool:
      replacement = value.to(NodeKind::kString).toString();
      break;
    case NodeKind::kString:
      replacement = fmt::format("\"{}\"", value.toString());
      break;
    case NodeKind::kJson:
      if (key.empty()) {
        return value.toString();
      }
      replacement = value.toString();
      break;
    default:
      VLOG(1) << "Rejected JSON update of key '" << key << "' with " << value;
      return folly::makeUnexpected(Status::TypeError(
          "Unsupported replacement value kind: {}",
          NodeKindName::toName(value.kind())));
  }

  auto span = findValue(document, key);
  if (span.hasError()) {
    VLOG(1) << "Cannot update key '" << key << "': " << span.error();
    return folly::makeUnexpected(std::move(span.error()));
  }

  std::string result;
  result.reserve(document.size() - span->size() + replacement.size());
  result.append(document.substr(0, span->begin));
  result.append(replacement);
  result.append(document.substr(span->end));
  return result;
}

Expected<std::string>
update(const Node& document, std::string_view key, const Node& value) {
  if (document.kind() != NodeKind::kJson) {
    return folly::makeUnexpected(Status::TypeError(
        "Cannot update a {} node, expected JSON",
        NodeKindName::toName(document.kind())));
  }
  return update(document.value<NodeKind::kJson>(), key, value);
}

std::string toWireBytes(const Node& node) {
  switch (node.kind()) {
    case NodeKind::kJson:
      return node.value<NodeKind::kJson>();
    case NodeKind::kString:
      return fmt::format("\"{}\"", node.value<NodeKind::kString>());
    default:
      return node.toString();
  }
}

} // namespace facebook::tdtl::json
