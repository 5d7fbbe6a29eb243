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
#ifndef UUID_V7_H
#define UUID_V7_H

#include <array>
#include <string>
#include <random>

#include "uv47_uuid.h"

namespace uv47 {

/**
 * @brief A class that generates RFC 9562 UUID version 7 identifiers
 *
 * The leading 48 bits hold the Unix epoch time in milliseconds, so identifiers
 * generated later sort after identifiers generated earlier (down to the
 * millisecond). rand_a and rand_b are filled from a random source.
 */
class UUIDv7 {
public:
    /**
     * @brief Generates a new identifier stamped with the current time
     */
    UUIDv7();

    /**
     * @brief Generates a new identifier stamped with the given time
     * @param timestamp_ms Milliseconds since the Unix epoch, low 48 bits are used
     */
    explicit UUIDv7(uint64_t timestamp_ms);
    ~UUIDv7() = default;

    /**
     * @brief Converts the identifier to the 8-4-4-4-12 string format
     *
     * xxxxxxxx-xxxx-7xxx-yxxx-xxxxxxxxxxxx
     * where 7 is the version and y is the variant.
     */
    std::string
    to_string() const;

    const std::array<uint8_t, 16> &
    get_data() const {
        return uuid.get_data();
    }

    const Uuid &
    get_uuid() const {
        return uuid;
    }

    uint64_t
    timestamp_ms() const;

    /**
     * @brief Current Unix epoch time in milliseconds
     */
    static uint64_t
    now_ms();

private:
    Uuid uuid;

    static Uuid
    generate(uint64_t timestamp_ms);
};

} // namespace uv47

#endif /* UUID_V7_H */
