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
#include "tdtl/common/base/Status.h"

#include "tdtl/common/base/Exceptions.h"

namespace facebook::tdtl {

std::string_view toString(StatusCode code) {
  switch (code) {
    case StatusCode::kOK:
      return "OK";
    case StatusCode::kUserError:
      return "User error";
    case StatusCode::kTypeError:
      return "Type error";
    case StatusCode::kKeyError:
      return "Key error";
    case StatusCode::kInvalid:
      return "Invalid";
    case StatusCode::kNotImplemented:
      return "NotImplemented";
  }
  return "Unknown";
}

Status::Status(StatusCode code, std::string message)
    : state_(std::make_unique<State>(State{code, std::move(message)})) {
  TDTL_CHECK_NE(
      static_cast<int>(code),
      static_cast<int>(StatusCode::kOK),
      "Cannot construct an OK status with a message");
}

const std::string& Status::message() const {
  static const std::string kEmpty;
  return ok() ? kEmpty : state_->message;
}

std::string Status::toString() const {
  if (ok()) {
    return "OK";
  }
  return fmt::format("{}: {}", tdtl::toString(code()), state_->message);
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
  return os << status.toString();
}

} // namespace facebook::tdtl
