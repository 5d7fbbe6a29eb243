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
/** Keyed UUIDv7 <-> UUIDv4 facade transform */
#ifndef _UV47_H
#define _UV47_H

#include <string>
#include "uv47_types.h"
#include "uv47_uuid.h"
#include "uv47_params.h"

namespace uv47 {

/*** Core transform, total over all inputs ***/

// Masks rand_a/rand_b with a keystream derived from the timestamp and stamps
// the facade version/variant. The timestamp bits are left as they are.
Uuid encode(const Uuid &id, Key key);

// Inverse of encode: rederives the keystream from the (unmasked) timestamp,
// removes it and restores the time-ordered version/variant.
Uuid decode(const Uuid &id, Key key);

/*** Raw buffer boundary ***/

// Both buffers must be exactly 16 bytes, anything else is
// UV47_ERR_INVALID_LENGTH. out is untouched on failure.
uv47_status_t encode(const void *id, size_t id_len,
                     const void *key, size_t key_len,
                     Uuid &out);
uv47_status_t decode(const void *id, size_t id_len,
                     const void *key, size_t key_len,
                     Uuid &out);

/*** Canonical text boundary ***/

// Input must be a version 7 identifier, otherwise UV47_ERR_MISMATCH
uv47_status_t encodeStr(const std::string &text, Key key, std::string &out);
// Input must be a version 4 facade, otherwise UV47_ERR_MISMATCH
uv47_status_t decodeStr(const std::string &text, Key key, std::string &out);

} // namespace uv47

class uv47EnumStrings {
    public:
        static std::string statusStr(const uv47_status_t &status);
        static std::string fieldStr(const uv47_field_t &field);
};

#endif
