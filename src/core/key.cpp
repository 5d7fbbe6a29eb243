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
#include <array>

#include "uv47_params.h"
#include "common/str_tools.h"

namespace uv47 {

namespace {

    uint64_t
    load64le(const uint8_t *p) {
        uint64_t v = 0;
        for (int i = 7; i >= 0; i--) {
            v = (v << 8) | p[i];
        }
        return v;
    }

} // anonymous namespace

uv47_status_t
Key::fromBytes(const void *buf, size_t len, Key &out) {
    if (buf == nullptr) {
        return UV47_ERR_INVALID_PARAM;
    }
    if (len != KEY_SIZE) {
        return UV47_ERR_INVALID_LENGTH;
    }

    const uint8_t *bytes = static_cast<const uint8_t *>(buf);
    out.k0 = load64le(bytes);
    out.k1 = load64le(bytes + 8);
    return UV47_SUCCESS;
}

uv47_status_t
Key::fromHex(const std::string &hex, Key &out) {
    std::array<uint8_t, KEY_SIZE> bytes{};
    const uv47_status_t status = hex_to_bytes(hex_trim(hex), bytes.data(), bytes.size());
    if (status != UV47_SUCCESS) {
        return status;
    }

    return fromBytes(bytes.data(), bytes.size(), out);
}

} // namespace uv47
