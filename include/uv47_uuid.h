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
#ifndef _UV47_UUID_H
#define _UV47_UUID_H

#include <array>
#include <string>
#include "uv47_types.h"

namespace uv47 {

/**
 * @brief A 128-bit identifier held as 16 big-endian bytes
 *
 * The same physical layout is shared by the time-ordered (version 7) and the
 * facade (version 4) shapes:
 *
 *   | timestamp:48 | version:4 | rand_a:12 | variant:2 | rand_b:62 |
 *
 * No shape is enforced here, any 128-bit pattern is a valid Uuid.
 */
class Uuid {
public:
    /**
     * @brief Constructs the all-zero identifier
     */
    Uuid() : data{} {}

    explicit Uuid(const std::array<uint8_t, UUID_SIZE> &bytes) : data(bytes) {}

    /**
     * @brief Builds an identifier from its two big-endian 64-bit halves
     * @param hi Bytes 0..7
     * @param lo Bytes 8..15
     */
    static Uuid
    fromWords(uint64_t hi, uint64_t lo);

    /**
     * @brief Copies a raw buffer into an identifier
     *
     * The buffer must hold exactly UUID_SIZE bytes. Shorter or longer input is
     * rejected rather than padded or truncated.
     *
     * @return UV47_SUCCESS, UV47_ERR_INVALID_PARAM for a null buffer or
     *         UV47_ERR_INVALID_LENGTH
     */
    static uv47_status_t
    fromBytes(const void *buf, size_t len, Uuid &out);

    uint64_t
    hi() const;
    uint64_t
    lo() const;

    const std::array<uint8_t, UUID_SIZE> &
    get_data() const {
        return data;
    }

    /**
     * @brief Canonical lowercase 8-4-4-4-12 text form
     */
    std::string
    to_string() const;

    bool
    operator==(const Uuid &other) const {
        return data == other.data;
    }
    bool
    operator!=(const Uuid &other) const {
        return data != other.data;
    }
    // Byte order comparison, which is timestamp order for version 7
    bool
    operator<(const Uuid &other) const {
        return data < other.data;
    }

private:
    std::array<uint8_t, UUID_SIZE> data;
};

// Typed view of the five sub-fields of a Uuid
struct Fields {
    uint64_t timestamp = 0; // 48 bits
    uint8_t version = 0; // 4 bits
    uint16_t randA = 0; // 12 bits
    uint8_t variant = 0; // 2 bits
    uint64_t randB = 0; // 62 bits
};

/**
 * @brief Slices an identifier into its sub-fields
 *
 * Total over every 128-bit input, version and variant are reported as found.
 */
Fields
split(const Uuid &id);

/**
 * @brief Reassembles sub-fields into an identifier
 *
 * Each field contributes only the low bits that fit its width.
 * join(split(x)) == x for every x.
 */
Uuid
join(const Fields &fields);

uint8_t
version(const Uuid &id);
uint8_t
variant(const Uuid &id);

// Version 7 with the RFC variant
bool
isTimeOrdered(const Uuid &id);

// Version 4 with the RFC variant
bool
isFacade(const Uuid &id);

} // namespace uv47

#endif
