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
#ifndef _UV47_KEYSTREAM_H
#define _UV47_KEYSTREAM_H

#include <cstdint>
#include "uv47_types.h"
#include "uv47_params.h"

namespace uv47 {

// Size of the PRF message: 6 timestamp bytes, selector, one zero pad byte
constexpr size_t KEYSTREAM_MSG_SIZE = 8;

/**
 * @brief Derives the 64-bit keystream block for one masked field
 *
 * One SipHash-2-4 call keyed by (key.k0, key.k1) over
 *
 *   | timestamp big-endian (6) | field (1) | 0x00 (1) |
 *
 * The same (timestamp, key, field) always gives the same block, which is all
 * decode needs to undo encode.
 *
 * @throws std::invalid_argument if timestamp does not fit in 48 bits or the
 *         field selector is not one of uv47_field_t
 */
uint64_t
deriveMask(uint64_t timestamp, const Key &key, uv47_field_t field);

// Keystream block truncated to the 12 bits of rand_a
uint16_t
maskRandA(uint64_t timestamp, const Key &key);

// Keystream block truncated to the 62 bits of rand_b
uint64_t
maskRandB(uint64_t timestamp, const Key &key);

} // namespace uv47

#endif /* _UV47_KEYSTREAM_H */
