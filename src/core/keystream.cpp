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
#include <stdexcept>

#include <absl/strings/str_format.h>

#include "keystream.h"
#include "siphash/siphash.h"

namespace uv47 {

uint64_t
deriveMask(uint64_t timestamp, const Key &key, uv47_field_t field) {
    if (timestamp > TIMESTAMP_MASK) {
        throw std::invalid_argument(
            absl::StrFormat("Keystream timestamp 0x%x does not fit in %d bits",
                            timestamp, TIMESTAMP_BITS));
    }
    if (field != UV47_FIELD_RAND_A && field != UV47_FIELD_RAND_B) {
        throw std::invalid_argument(
            absl::StrFormat("Unknown keystream field selector %d", static_cast<int>(field)));
    }

    std::array<uint8_t, KEYSTREAM_MSG_SIZE> msg{};
    for (int i = 0; i < 6; i++) {
        msg[i] = static_cast<uint8_t>(timestamp >> (40 - 8 * i));
    }
    msg[6] = static_cast<uint8_t>(field);

    return sipHash24(msg.data(), msg.size(), key.k0, key.k1);
}

uint16_t
maskRandA(uint64_t timestamp, const Key &key) {
    return static_cast<uint16_t>(deriveMask(timestamp, key, UV47_FIELD_RAND_A) & RAND_A_MASK);
}

uint64_t
maskRandB(uint64_t timestamp, const Key &key) {
    return deriveMask(timestamp, key, UV47_FIELD_RAND_B) & RAND_B_MASK;
}

} // namespace uv47
