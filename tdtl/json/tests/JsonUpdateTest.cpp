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

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "tdtl/flag_definitions/flags.h"

namespace facebook::tdtl::json {
namespace {

class JsonUpdateTest : public testing::Test {
 protected:
  void TearDown() override {
    FLAGS_tdtl_json_update_max_depth = 128;
  }

  static std::string updateOrFail(
      std::string_view document,
      std::string_view key,
      const Node& value) {
    auto result = update(document, key, value);
    EXPECT_TRUE(result.hasValue()) << result.error();
    return result.hasValue() ? result.value() : "";
  }

  static Status updateError(
      std::string_view document,
      std::string_view key,
      const Node& value) {
    auto result = update(document, key, value);
    EXPECT_TRUE(result.hasError()) << "Unexpected success: " << *result;
    return result.hasError() ? result.error() : Status::OK();
  }
};

TEST_F(JsonUpdateTest, scalarValues) {
  EXPECT_EQ(
      updateOrFail(R"({"a":1,"b":2})", "b", Node::integer(5)),
      R"({"a":1,"b":5})");
  EXPECT_EQ(
      updateOrFail(R"({"a":1,"b":2})", "a", Node::floating(0.5)),
      R"({"a":0.500000,"b":2})");
  EXPECT_EQ(
      updateOrFail(R"({"a":1,"b":2})", "a", Node::boolean(false)),
      R"({"a":false,"b":2})");
  EXPECT_EQ(
      updateOrFail(R"({"a":1})", "a", Node::string("x y")),
      R"({"a":"x y"})");
}

TEST_F(JsonUpdateTest, replacesAnyValueShape) {
  EXPECT_EQ(
      updateOrFail(R"({"a":{"x":[1,2]},"b":true})", "a", Node::integer(0)),
      R"({"a":0,"b":true})");
  EXPECT_EQ(
      updateOrFail(R"({"a":"s","b":null})", "b", Node::string("t")),
      R"({"a":"s","b":"t"})");
  EXPECT_EQ(
      updateOrFail(R"({"a":[],"b":-1.5e3})", "b", Node::integer(7)),
      R"({"a":[],"b":7})");
  EXPECT_EQ(
      updateOrFail(R"({"a":"with \"quotes\" }"})", "a", Node::integer(1)),
      R"({"a":1})");
}

TEST_F(JsonUpdateTest, preservesFormatting) {
  const std::string document = "{\n  \"b\" : 2 ,\n  \"a\":  [1, 2]\n}";
  EXPECT_EQ(
      updateOrFail(document, "a", Node::json(R"({"n":1})")),
      "{\n  \"b\" : 2 ,\n  \"a\":  {\"n\":1}\n}");
  EXPECT_EQ(
      updateOrFail(document, "b", Node::integer(30)),
      "{\n  \"b\" : 30 ,\n  \"a\":  [1, 2]\n}");
}

TEST_F(JsonUpdateTest, jsonValue) {
  EXPECT_EQ(
      updateOrFail(R"({"a":1})", "a", Node::json("[1,2]")),
      R"({"a":[1,2]})");
  EXPECT_EQ(
      updateOrFail(R"({"a":1})", "", Node::json(R"({"z":0})")),
      R"({"z":0})");
}

TEST_F(JsonUpdateTest, wholeDocumentIgnoresPriorContent) {
  for (const auto* document : {"not json", "[1]", "", R"({"a":)"}) {
    EXPECT_EQ(
        updateOrFail(document, "", Node::json(R"({"x":9})")), R"({"x":9})")
        << document;
  }
}

TEST_F(JsonUpdateTest, unsupportedValueKind) {
  for (const auto& value :
       {Node::undefined(), Node::null(), Node::array("[1]")}) {
    auto status = updateError(R"({"a":1})", "a", value);
    EXPECT_TRUE(status.isTypeError()) << status;
    EXPECT_EQ(
        status.message(),
        fmt::format(
            "Unsupported replacement value kind: {}",
            NodeKindName::toName(value.kind())));
  }
}

TEST_F(JsonUpdateTest, missingKey) {
  auto status = updateError(R"({"a":1})", "b", Node::integer(1));
  EXPECT_TRUE(status.isKeyError());
  EXPECT_EQ(status.message(), "Key not found: b");

  EXPECT_TRUE(updateError("{}", "a", Node::integer(1)).isKeyError());
  EXPECT_TRUE(updateError(" { } ", "a", Node::integer(1)).isKeyError());

  // Only top-level members are matched.
  EXPECT_TRUE(
      updateError(R"({"x":{"a":1}})", "a", Node::integer(1)).isKeyError());
  EXPECT_TRUE(
      updateError(R"({"x":1})", "", Node::integer(1)).isKeyError());
}

TEST_F(JsonUpdateTest, malformedDocument) {
  for (const auto* document :
       {"",
        "[1]",
        "\"a\"",
        R"({"a")",
        R"({"a" 1})",
        R"({"a":})",
        R"({"a":1 "b":2})",
        R"({a:1})",
        R"({"a":tru,"b":1})",
        R"({"a":"\x","b":1})",
        R"({"a":"\u12","b":1})",
        R"({"a":[1,2,"b":1})",
        R"({"a":"unterminated)",
        R"({"a":-,"b":1})",
        R"({"a":1-2,"b":1})",
        R"({"a":1.2.3,"b":1})",
        R"({"a":-e+,"b":1})",
        R"({"a":01,"b":1})",
        R"({"a":1.,"b":1})",
        R"({"a":.5,"b":1})",
        R"({"a":1e,"b":1})",
        R"({"a":+1,"b":1})",
        R"({"a":nul,"b":1})"}) {
    auto status = updateError(document, "b", Node::integer(1));
    EXPECT_TRUE(status.isInvalid()) << document << ": " << status;
    EXPECT_NE(
        status.message().find("Malformed JSON document at offset"),
        std::string::npos)
        << status;
  }
}

TEST_F(JsonUpdateTest, numberLiterals) {
  const std::string document =
      R"({"a":0,"b":-0.5e-10,"c":1E+2,"d":-12.25,"e":10})";
  EXPECT_EQ(
      updateOrFail(document, "e", Node::integer(1)),
      R"({"a":0,"b":-0.5e-10,"c":1E+2,"d":-12.25,"e":1})");
}

TEST_F(JsonUpdateTest, keyIsFoundBeforeTrailingText) {
  // Scanning stops at the matched value.
  EXPECT_EQ(
      updateOrFail(R"({"a":1,"b":2, garbage)", "a", Node::integer(3)),
      R"({"a":3,"b":2, garbage)");
}

TEST_F(JsonUpdateTest, escapedKeys) {
  EXPECT_EQ(
      updateOrFail(R"({"a\u0062":1})", "ab", Node::integer(2)),
      R"({"a\u0062":2})");
  EXPECT_EQ(
      updateOrFail(R"({"a\"b":1})", "a\"b", Node::integer(2)),
      R"({"a\"b":2})");
  EXPECT_EQ(
      updateOrFail(R"({"tab\t":1})", "tab\t", Node::integer(2)),
      R"({"tab\t":2})");
  EXPECT_EQ(
      updateOrFail(R"({"\u00e9":1})", "\xC3\xA9", Node::integer(2)),
      R"({"\u00e9":2})");
  // Surrogate pair for U+1F600.
  EXPECT_EQ(
      updateOrFail(
          R"({"\ud83d\ude00":1})", "\xF0\x9F\x98\x80", Node::json("{}")),
      R"({"\ud83d\ude00":{}})");
  EXPECT_TRUE(
      updateError(R"({"a\u0062":1})", "a\\u0062", Node::integer(2))
          .isKeyError());
}

TEST_F(JsonUpdateTest, firstDuplicateWins) {
  EXPECT_EQ(
      updateOrFail(R"({"a":1,"a":2})", "a", Node::integer(9)),
      R"({"a":9,"a":2})");
}

TEST_F(JsonUpdateTest, maxDepth) {
  const std::string document = R"({"a":[[1]],"b":0})";
  EXPECT_EQ(
      updateOrFail(document, "b", Node::integer(1)), R"({"a":[[1]],"b":1})");

  FLAGS_tdtl_json_update_max_depth = 2;
  auto status = updateError(document, "b", Node::integer(1));
  EXPECT_TRUE(status.isInvalid());
  EXPECT_NE(
      status.message().find("nesting exceeds maximum depth of 2"),
      std::string::npos);

  EXPECT_EQ(
      updateOrFail(R"({"a":[1],"b":0})", "b", Node::integer(1)),
      R"({"a":[1],"b":1})");
}

TEST_F(JsonUpdateTest, findValue) {
  const std::string document = R"({"a": [1, 2], "b" :"x"})";
  auto span = findValue(document, "a");
  ASSERT_TRUE(span.hasValue());
  EXPECT_EQ(document.substr(span->begin, span->size()), "[1, 2]");

  span = findValue(document, "b");
  ASSERT_TRUE(span.hasValue());
  EXPECT_EQ(span.value(), (ValueSpan{19, 22}));

  EXPECT_TRUE(findValue(document, "c").error().isKeyError());
}

TEST_F(JsonUpdateTest, nodeDocument) {
  auto result =
      update(Node::json(R"({"a":1})"), "a", Node::string("replaced"));
  ASSERT_TRUE(result.hasValue());
  EXPECT_EQ(result.value(), R"({"a":"replaced"})");

  auto error = update(Node::string(R"({"a":1})"), "a", Node::integer(1));
  ASSERT_TRUE(error.hasError());
  EXPECT_TRUE(error.error().isTypeError());
  EXPECT_EQ(
      error.error().message(), "Cannot update a String node, expected JSON");
}

TEST_F(JsonUpdateTest, toWireBytes) {
  EXPECT_EQ(toWireBytes(Node::json(R"({"a":1})")), R"({"a":1})");
  EXPECT_EQ(toWireBytes(Node::string("abc")), R"("abc")");
  EXPECT_EQ(toWireBytes(Node::integer(-4)), "-4");
  EXPECT_EQ(toWireBytes(Node::floating(1.5)), "1.500000");
  EXPECT_EQ(toWireBytes(Node::boolean(true)), "true");
  EXPECT_EQ(toWireBytes(Node::null()), "null");
  EXPECT_EQ(toWireBytes(Node::array("[1]")), "[1]");
}

} // namespace
} // namespace facebook::tdtl::json
