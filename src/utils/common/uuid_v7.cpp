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
#include "uuid_v7.h"

#include <chrono>

#include "uuid_text.h"

namespace uv47 {

UUIDv7::UUIDv7() : uuid(generate(now_ms())) {}

UUIDv7::UUIDv7(uint64_t timestamp_ms) : uuid(generate(timestamp_ms)) {}

std::string
UUIDv7::to_string() const {
    return formatUuid(uuid);
}

uint64_t
UUIDv7::timestamp_ms() const {
    return split(uuid).timestamp;
}

uint64_t
UUIDv7::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Uuid
UUIDv7::generate(uint64_t timestamp_ms) {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) | rd());

    Fields fields;
    fields.timestamp = timestamp_ms & TIMESTAMP_MASK;
    fields.version = ORIGINAL_VERSION;
    fields.randA = static_cast<uint16_t>(gen() & RAND_A_MASK);
    fields.variant = ORIGINAL_VARIANT;
    fields.randB = gen() & RAND_B_MASK;
    return join(fields);
}

} // namespace uv47
