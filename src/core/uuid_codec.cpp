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
#include <cstring>

#include "uv47_uuid.h"
#include "common/uuid_text.h"

namespace uv47 {

namespace {

    uint64_t
    load64be(const uint8_t *p) {
        uint64_t v = 0;
        for (int i = 0; i < 8; i++) {
            v = (v << 8) | p[i];
        }
        return v;
    }

    void
    store64be(uint8_t *p, uint64_t v) {
        for (int i = 7; i >= 0; i--) {
            p[i] = static_cast<uint8_t>(v & 0xff);
            v >>= 8;
        }
    }

} // anonymous namespace

Uuid
Uuid::fromWords(uint64_t hi, uint64_t lo) {
    std::array<uint8_t, UUID_SIZE> bytes;
    store64be(bytes.data(), hi);
    store64be(bytes.data() + 8, lo);
    return Uuid(bytes);
}

uv47_status_t
Uuid::fromBytes(const void *buf, size_t len, Uuid &out) {
    if (buf == nullptr) {
        return UV47_ERR_INVALID_PARAM;
    }
    if (len != UUID_SIZE) {
        return UV47_ERR_INVALID_LENGTH;
    }

    std::memcpy(out.data.data(), buf, UUID_SIZE);
    return UV47_SUCCESS;
}

uint64_t
Uuid::hi() const {
    return load64be(data.data());
}

uint64_t
Uuid::lo() const {
    return load64be(data.data() + 8);
}

std::string
Uuid::to_string() const {
    return formatUuid(*this);
}

/*
 * hi: | timestamp 63..16 | version 15..12 | rand_a 11..0 |
 * lo: | variant 63..62   | rand_b 61..0                  |
 */
Fields
split(const Uuid &id) {
    const uint64_t hi = id.hi();
    const uint64_t lo = id.lo();

    Fields fields;
    fields.timestamp = hi >> 16;
    fields.version = static_cast<uint8_t>((hi >> 12) & 0xF);
    fields.randA = static_cast<uint16_t>(hi & RAND_A_MASK);
    fields.variant = static_cast<uint8_t>(lo >> RAND_B_BITS);
    fields.randB = lo & RAND_B_MASK;
    return fields;
}

Uuid
join(const Fields &fields) {
    const uint64_t hi = ((fields.timestamp & TIMESTAMP_MASK) << 16) |
                        (uint64_t(fields.version & 0xF) << 12) |
                        (fields.randA & RAND_A_MASK);
    const uint64_t lo = (uint64_t(fields.variant & 0x3) << RAND_B_BITS) |
                        (fields.randB & RAND_B_MASK);
    return Uuid::fromWords(hi, lo);
}

uint8_t
version(const Uuid &id) {
    return id.get_data()[6] >> 4;
}

uint8_t
variant(const Uuid &id) {
    return id.get_data()[8] >> 6;
}

bool
isTimeOrdered(const Uuid &id) {
    return version(id) == ORIGINAL_VERSION && variant(id) == ORIGINAL_VARIANT;
}

bool
isFacade(const Uuid &id) {
    return version(id) == FACADE_VERSION && variant(id) == FACADE_VARIANT;
}

} // namespace uv47
