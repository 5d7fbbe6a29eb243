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
#ifndef __STR_TOOLS_H
#define __STR_TOOLS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/strip.h>
#include "uv47_types.h"

inline int hex_nibble(char c) {
    if (absl::ascii_isdigit(static_cast<unsigned char>(c)))
        return c - '0';
    if (!absl::ascii_isxdigit(static_cast<unsigned char>(c)))
        return -1;
    return absl::ascii_tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

// Strips whitespace and an optional 0x/0X prefix
inline std::string_view hex_trim(std::string_view str) {
    str = absl::StripAsciiWhitespace(str);
    if (absl::StartsWithIgnoreCase(str, "0x"))
        str.remove_prefix(2);
    return str;
}

// Decodes exactly 2*len hex digits into buf, buf is untouched on failure
inline uv47_status_t hex_to_bytes(std::string_view hex, uint8_t *buf, size_t len) {
    if (hex.size() != 2 * len)
        return UV47_ERR_INVALID_LENGTH;

    for (size_t i = 0; i < hex.size(); i++) {
        if (hex_nibble(hex[i]) < 0)
            return UV47_ERR_INVALID_PARAM;
    }

    for (size_t i = 0; i < len; i++) {
        buf[i] = static_cast<uint8_t>((hex_nibble(hex[2 * i]) << 4) |
                                      hex_nibble(hex[2 * i + 1]));
    }
    return UV47_SUCCESS;
}

#endif
