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
#ifndef UUID_TEXT_H
#define UUID_TEXT_H

#include <string>
#include <string_view>
#include "uv47_uuid.h"

namespace uv47 {

// Length of the canonical 8-4-4-4-12 form
constexpr size_t UUID_TEXT_SIZE = 36;

/**
 * @brief Parses the canonical dashed hexadecimal form of an identifier
 *
 * Accepts exactly xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx with hex digits of
 * either case. No braces, no urn: prefix, no surrounding whitespace.
 *
 * @param text Input text
 * @param out  Parsed identifier, untouched on failure
 * @return UV47_SUCCESS, UV47_ERR_INVALID_LENGTH if text is not 36 characters,
 *         UV47_ERR_INVALID_PARAM for a misplaced dash or non-hex digit
 */
uv47_status_t
parseUuid(std::string_view text, Uuid &out);

/**
 * @brief Formats an identifier in lowercase canonical form
 */
std::string
formatUuid(const Uuid &id);

} // namespace uv47

#endif /* UUID_TEXT_H */
