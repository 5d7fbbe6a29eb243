/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef _UV47_TYPES_H
#define _UV47_TYPES_H
#include <cstdint>
#include <cstddef>
#include <string>
#include <unordered_map>

// Configuration is passed around as a flat string map, the same way for
// every source (literal, environment, file).
typedef std::unordered_map<std::string, std::string> uv47_params_t;

typedef enum {
    UV47_SUCCESS = 0,
    UV47_ERR_INVALID_LENGTH = -1,
    UV47_ERR_INVALID_PARAM = -2,
    UV47_ERR_MISMATCH = -3,
    UV47_ERR_NOT_FOUND = -4,
    UV47_ERR_UNKNOWN = -5
} uv47_status_t;

// Selects which masked field a keystream block is derived for.
// The numeric values are part of the PRF input and must never change.
typedef enum : uint8_t {
    UV47_FIELD_RAND_A = 0,
    UV47_FIELD_RAND_B = 1
} uv47_field_t;

namespace uv47 {

constexpr size_t UUID_SIZE = 16;
constexpr size_t KEY_SIZE = 16;

constexpr uint8_t ORIGINAL_VERSION = 7;
constexpr uint8_t FACADE_VERSION = 4;

// RFC 9562 variant, binary 10, used by both shapes
constexpr uint8_t ORIGINAL_VARIANT = 0x2;
constexpr uint8_t FACADE_VARIANT = 0x2;

constexpr unsigned TIMESTAMP_BITS = 48;
constexpr unsigned RAND_A_BITS = 12;
constexpr unsigned RAND_B_BITS = 62;

constexpr uint64_t TIMESTAMP_MASK = (uint64_t(1) << TIMESTAMP_BITS) - 1;
constexpr uint64_t RAND_A_MASK = (uint64_t(1) << RAND_A_BITS) - 1;
constexpr uint64_t RAND_B_MASK = (uint64_t(1) << RAND_B_BITS) - 1;

} // namespace uv47

#endif
