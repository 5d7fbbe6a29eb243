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
#ifndef _UV47_SIPHASH_H
#define _UV47_SIPHASH_H

#include <cstddef>
#include <cstdint>

namespace uv47 {

/**
 * @brief SipHash-2-4 with a 64-bit output
 *
 * Two compression rounds per 8-byte block and four finalization rounds. The
 * amount of work depends on len only, never on the data or key values.
 *
 * @param data Message bytes
 * @param len  Message length in bytes
 * @param k0   Key bytes 0..7 read little-endian
 * @param k1   Key bytes 8..15 read little-endian
 */
uint64_t
sipHash24(const uint8_t *data, size_t len, uint64_t k0, uint64_t k1);

} // namespace uv47

#endif /* _UV47_SIPHASH_H */
