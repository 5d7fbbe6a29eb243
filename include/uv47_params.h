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
#ifndef _UV47_PARAMS_H
#define _UV47_PARAMS_H

#include <string>
#include <cstdint>
#include "uv47_types.h"

namespace uv47 {

// 128-bit secret, the two SipHash key words. Passed by value everywhere,
// nothing in the library keeps a copy past the call that received it.
class Key {
    public:
        uint64_t k0;
        uint64_t k1;

        Key() : k0(0), k1(0) {}
        Key(const uint64_t key0, const uint64_t key1) : k0(key0), k1(key1) {}
        Key(const Key &key) = default;
        Key &operator=(const Key &key) = default;
        ~Key() = default;

        // 16 raw bytes, each half read little-endian
        static uv47_status_t fromBytes(const void *buf, size_t len, Key &out);

        // 32 hex digits, optional 0x prefix, surrounding whitespace ignored
        static uv47_status_t fromHex(const std::string &hex, Key &out);

        bool operator==(const Key &other) const {
            return k0 == other.k0 && k1 == other.k1;
        }
        bool operator!=(const Key &other) const {
            return !(*this == other);
        }
};

// Where the secret key comes from. The library never reads a key on its own,
// callers resolve one through this class and pass it to encode/decode.
class KeyConfig {
    private:

        uv47_params_t params;

    public:

        // Literal hex key
        static constexpr const char *KEY_PARAM = "key";
        // Path to a file holding the hex key
        static constexpr const char *KEY_FILE_PARAM = "key_file";
        // Name of an environment variable holding the hex key
        static constexpr const char *KEY_ENV_PARAM = "key_env";

        // Consulted when no parameter names a source
        static constexpr const char *DEFAULT_KEY_VAR = "UV47_KEY";

        /*
         * Sources are tried in order: key, key_file, key_env.
         * With none of them set the DEFAULT_KEY_VAR environment variable is used.
         */
        explicit KeyConfig(const uv47_params_t &key_params = uv47_params_t()) {
            this->params = key_params;
        }
        KeyConfig(const KeyConfig &cfg) = default;
        ~KeyConfig() = default;

        uv47_status_t load(Key &key) const;

        // Human readable description of the selected source, never the key
        std::string source() const;
};

} // namespace uv47

#endif
