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

#include <gflags/gflags.h>

/// Maximum nesting depth the JSON partial-update scanner descends while
/// skipping over a value. Documents nested deeper fail with an Invalid status.
DECLARE_int32(tdtl_json_update_max_depth);

/// When true, Float to Int coercion clamps values outside the int64 range to
/// the range limits. When false (the default) such values coerce to
/// Undefined. NaN always coerces to Undefined.
DECLARE_bool(tdtl_float_to_int_saturate);
