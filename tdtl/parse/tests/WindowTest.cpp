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

#include "tdtl/parse/Window.h"

#include <gtest/gtest.h>

#include "tdtl/common/base/tests/GTestUtils.h"

namespace facebook::tdtl::parse {
namespace {

TEST(WindowTest, tumbling) {
  auto window = WindowExpr::tumbling(10);
  EXPECT_EQ(window.kind(), ExprKind::kWindow);
  EXPECT_EQ(window.type(), WindowType::kTumbling);
  EXPECT_EQ(window.length(), 10);
  EXPECT_EQ(window.interval(), 10);
  EXPECT_FALSE(window.overlapping());
  EXPECT_EQ(window.toString(), "TUMBLINGWINDOW(10)");
  EXPECT_TRUE(window.inputs().empty());
}

TEST(WindowTest, hopping) {
  auto window = WindowExpr::hopping(10, 5);
  EXPECT_EQ(window.type(), WindowType::kHopping);
  EXPECT_EQ(window.length(), 10);
  EXPECT_EQ(window.interval(), 5);
  EXPECT_TRUE(window.overlapping());
  EXPECT_EQ(window.toString(), "HOPPINGWINDOW(10, 5)");
}

TEST(WindowTest, sliding) {
  auto window = WindowExpr::sliding(30);
  EXPECT_EQ(window.type(), WindowType::kSliding);
  EXPECT_EQ(window.length(), 30);
  EXPECT_EQ(window.interval(), 0);
  EXPECT_TRUE(window.overlapping());
  EXPECT_EQ(window.toString(), "SLIDINGWINDOW(30)");
}

TEST(WindowTest, session) {
  auto window = WindowExpr::session(60, 5);
  EXPECT_EQ(window.type(), WindowType::kSession);
  EXPECT_EQ(window.length(), 60);
  EXPECT_EQ(window.interval(), 5);
  EXPECT_FALSE(window.overlapping());
  EXPECT_EQ(window.toString(), "SESSIONWINDOW(60, 5)");
}

TEST(WindowTest, none) {
  WindowExpr window(WindowType::kNone, 0, 0);
  EXPECT_FALSE(window.overlapping());
  EXPECT_EQ(window.toString(), "NOWINDOW");
}

TEST(WindowTest, invalidParameters) {
  TDTL_ASSERT_USER_THROW(
      WindowExpr::tumbling(0), "Window length must be positive");
  TDTL_ASSERT_USER_THROW(
      WindowExpr::sliding(-1), "Window length must be positive");
  TDTL_ASSERT_USER_THROW(
      WindowExpr::hopping(10, 0), "Hopping interval must be positive");
  TDTL_ASSERT_USER_THROW(
      WindowExpr::hopping(10, 10),
      "Hopping interval must be shorter than the window length");
  TDTL_ASSERT_USER_THROW(
      WindowExpr::hopping(5, 10),
      "Hopping interval must be shorter than the window length");
  TDTL_ASSERT_USER_THROW(
      WindowExpr::session(10, 0), "Session gap must be positive");
  TDTL_ASSERT_USER_THROW(
      WindowExpr::session(0, 1), "Window length must be positive");
}

TEST(WindowTest, equality) {
  EXPECT_EQ(WindowExpr::tumbling(10), WindowExpr::tumbling(10));
  EXPECT_NE(WindowExpr::tumbling(10), WindowExpr::tumbling(20));
  EXPECT_NE(WindowExpr::tumbling(10), WindowExpr::sliding(10));
  EXPECT_NE(WindowExpr::hopping(10, 5), WindowExpr::hopping(10, 2));
  EXPECT_NE(WindowExpr::hopping(10, 5), WindowExpr::session(10, 5));
}

TEST(WindowTest, typeNames) {
  EXPECT_EQ(WindowTypeName::toName(WindowType::kSession), "SESSION");
  EXPECT_EQ(WindowTypeName::toWindowType("HOPPING"), WindowType::kHopping);
  EXPECT_FALSE(WindowTypeName::tryToWindowType("hopping").has_value());
}

} // namespace
} // namespace facebook::tdtl::parse
