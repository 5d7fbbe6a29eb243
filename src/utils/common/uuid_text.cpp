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
#include "uuid_text.h"

#include <array>
#include <iomanip>
#include <sstream>

#include "str_tools.h"

namespace uv47 {

namespace {

    bool
    isDashPosition(size_t i) {
        return i == 8 || i == 13 || i == 18 || i == 23;
    }

} // anonymous namespace

uv47_status_t
parseUuid(std::string_view text, Uuid &out) {
    if (text.size() != UUID_TEXT_SIZE) {
        return UV47_ERR_INVALID_LENGTH;
    }

    std::string hex;
    hex.reserve(2 * UUID_SIZE);
    for (size_t i = 0; i < text.size(); ++i) {
        if (isDashPosition(i)) {
            if (text[i] != '-') {
                return UV47_ERR_INVALID_PARAM;
            }
            continue;
        }
        hex.push_back(text[i]);
    }

    std::array<uint8_t, UUID_SIZE> bytes{};
    const uv47_status_t status = hex_to_bytes(hex, bytes.data(), bytes.size());
    if (status != UV47_SUCCESS) {
        return status;
    }

    out = Uuid(bytes);
    return UV47_SUCCESS;
}

std::string
formatUuid(const Uuid &id) {
    const auto &data = id.get_data();
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    // Format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    for (size_t i = 0; i < data.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(data[i]);
    }

    return oss.str();
}

} // namespace uv47
