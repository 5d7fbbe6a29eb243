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
#include <cstdlib>

#include "uv47_params.h"
#include "uv47.h"
#include "common/status.h"
#include "file/file_utils.h"

namespace uv47 {

namespace {

    const std::string *
    findParam(const uv47_params_t &params, const char *name) {
        auto it = params.find(name);
        if (it == params.end() || it->second.empty()) {
            return nullptr;
        }
        return &it->second;
    }

    uv47_status_t
    loadFromEnv(const std::string &var, Key &key) {
        const char *value = std::getenv(var.c_str());
        if (value == nullptr) {
            UV47_ERROR << "Key environment variable " << var << " is not set";
            return UV47_ERR_NOT_FOUND;
        }

        const uv47_status_t status = Key::fromHex(value, key);
        UV47_LOG_AND_RETURN_IF_ERROR(status,
            "environment variable " + var + " does not hold a 32 digit hex key");
        return UV47_SUCCESS;
    }

    uv47_status_t
    loadFromFile(const std::string &path, Key &key) {
        std::string contents;
        uv47_status_t status = readSecretFile(path, contents);
        if (status != UV47_SUCCESS) {
            return status;
        }

        status = Key::fromHex(contents, key);
        UV47_LOG_AND_RETURN_IF_ERROR(status, "key file " + path + " does not hold a 32 digit hex key");
        return UV47_SUCCESS;
    }

} // anonymous namespace

uv47_status_t
KeyConfig::load(Key &key) const {
    Key loaded;
    uv47_status_t status;

    if (const std::string *literal = findParam(params, KEY_PARAM)) {
        status = Key::fromHex(*literal, loaded);
        UV47_LOG_AND_RETURN_IF_ERROR(status, "key parameter is not a 32 digit hex key");
    } else if (const std::string *path = findParam(params, KEY_FILE_PARAM)) {
        status = loadFromFile(*path, loaded);
    } else if (const std::string *var = findParam(params, KEY_ENV_PARAM)) {
        status = loadFromEnv(*var, loaded);
    } else {
        status = loadFromEnv(DEFAULT_KEY_VAR, loaded);
    }

    if (status != UV47_SUCCESS) {
        return status;
    }

    UV47_DEBUG << "Loaded key from " << source();
    key = loaded;
    return UV47_SUCCESS;
}

std::string
KeyConfig::source() const {
    if (findParam(params, KEY_PARAM)) {
        return "parameter '" + std::string(KEY_PARAM) + "'";
    }
    if (const std::string *path = findParam(params, KEY_FILE_PARAM)) {
        return "file " + *path;
    }
    if (const std::string *var = findParam(params, KEY_ENV_PARAM)) {
        return "environment variable " + *var;
    }
    return "environment variable " + std::string(DEFAULT_KEY_VAR);
}

} // namespace uv47
