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
#include "siphash.h"

namespace {

inline uint64_t
rotl(uint64_t x, int b) {
    return (x << b) | (x >> (64 - b));
}

inline uint64_t
load64le(const uint8_t *p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; i--) {
        v = (v << 8) | p[i];
    }
    return v;
}

struct sipState {
    uint64_t v0, v1, v2, v3;

    sipState(uint64_t k0, uint64_t k1)
        : v0(k0 ^ 0x736f6d6570736575ULL),
          v1(k1 ^ 0x646f72616e646f6dULL),
          v2(k0 ^ 0x6c7967656e657261ULL),
          v3(k1 ^ 0x7465646279746573ULL) {}

    void
    round() {
        v0 += v1;
        v1 = rotl(v1, 13);
        v1 ^= v0;
        v0 = rotl(v0, 32);
        v2 += v3;
        v3 = rotl(v3, 16);
        v3 ^= v2;
        v0 += v3;
        v3 = rotl(v3, 21);
        v3 ^= v0;
        v2 += v1;
        v1 = rotl(v1, 17);
        v1 ^= v2;
        v2 = rotl(v2, 32);
    }

    void
    compress(uint64_t m) {
        v3 ^= m;
        round();
        round();
        v0 ^= m;
    }

    uint64_t
    finalize() {
        v2 ^= 0xff;
        round();
        round();
        round();
        round();
        return v0 ^ v1 ^ v2 ^ v3;
    }
};

} // anonymous namespace

namespace uv47 {

uint64_t
sipHash24(const uint8_t *data, size_t len, uint64_t k0, uint64_t k1) {
    sipState state(k0, k1);

    const size_t tail = len & 7;
    const uint8_t *end = data + (len - tail);
    for (const uint8_t *p = data; p != end; p += 8) {
        state.compress(load64le(p));
    }

    // Last block carries the remaining bytes and the message length in the top byte
    uint64_t b = static_cast<uint64_t>(len & 0xff) << 56;
    for (size_t i = 0; i < tail; i++) {
        b |= static_cast<uint64_t>(end[i]) << (8 * i);
    }
    state.compress(b);

    return state.finalize();
}

} // namespace uv47
