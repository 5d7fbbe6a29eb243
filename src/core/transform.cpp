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
#include "uv47.h"
#include "keystream.h"
#include "common/status.h"
#include "common/uuid_text.h"

namespace uv47 {

namespace {

    // XOR is its own inverse, so both directions share the masking step and
    // differ only in the version stamped on the result.
    Uuid
    applyMask(const Uuid &id, const Key &key, uint8_t target_version, uint8_t target_variant) {
        Fields fields = split(id);

        fields.randA ^= maskRandA(fields.timestamp, key);
        fields.randB ^= maskRandB(fields.timestamp, key);
        fields.version = target_version;
        fields.variant = target_variant;

        return join(fields);
    }

    uv47_status_t
    loadInputs(const void *id, size_t id_len,
               const void *key, size_t key_len,
               Uuid &uuid, Key &secret) {
        uv47_status_t status = Uuid::fromBytes(id, id_len, uuid);
        UV47_LOG_AND_RETURN_IF_ERROR(status,
            absl::StrFormat("identifier must be %d bytes, got %d", UUID_SIZE, id_len));

        status = Key::fromBytes(key, key_len, secret);
        UV47_LOG_AND_RETURN_IF_ERROR(status,
            absl::StrFormat("key must be %d bytes, got %d", KEY_SIZE, key_len));

        return UV47_SUCCESS;
    }

} // anonymous namespace

Uuid
encode(const Uuid &id, Key key) {
    return applyMask(id, key, FACADE_VERSION, FACADE_VARIANT);
}

Uuid
decode(const Uuid &id, Key key) {
    return applyMask(id, key, ORIGINAL_VERSION, ORIGINAL_VARIANT);
}

uv47_status_t
encode(const void *id, size_t id_len, const void *key, size_t key_len, Uuid &out) {
    Uuid uuid;
    Key secret;
    const uv47_status_t status = loadInputs(id, id_len, key, key_len, uuid, secret);
    if (status != UV47_SUCCESS) {
        return status;
    }

    out = encode(uuid, secret);
    return UV47_SUCCESS;
}

uv47_status_t
decode(const void *id, size_t id_len, const void *key, size_t key_len, Uuid &out) {
    Uuid uuid;
    Key secret;
    const uv47_status_t status = loadInputs(id, id_len, key, key_len, uuid, secret);
    if (status != UV47_SUCCESS) {
        return status;
    }

    out = decode(uuid, secret);
    return UV47_SUCCESS;
}

uv47_status_t
encodeStr(const std::string &text, Key key, std::string &out) {
    Uuid uuid;
    uv47_status_t status = parseUuid(text, uuid);
    UV47_LOG_AND_RETURN_IF_ERROR(status, "cannot parse identifier to encode");

    if (!isTimeOrdered(uuid)) {
        status = UV47_ERR_MISMATCH;
        UV47_LOG_AND_RETURN_IF_ERROR(status,
            absl::StrFormat("expected a version %d identifier, got version %d",
                            ORIGINAL_VERSION, version(uuid)));
    }

    out = formatUuid(encode(uuid, key));
    return UV47_SUCCESS;
}

uv47_status_t
decodeStr(const std::string &text, Key key, std::string &out) {
    Uuid uuid;
    uv47_status_t status = parseUuid(text, uuid);
    UV47_LOG_AND_RETURN_IF_ERROR(status, "cannot parse identifier to decode");

    if (!isFacade(uuid)) {
        status = UV47_ERR_MISMATCH;
        UV47_LOG_AND_RETURN_IF_ERROR(status,
            absl::StrFormat("expected a version %d facade, got version %d",
                            FACADE_VERSION, version(uuid)));
    }

    out = formatUuid(decode(uuid, key));
    return UV47_SUCCESS;
}

} // namespace uv47
