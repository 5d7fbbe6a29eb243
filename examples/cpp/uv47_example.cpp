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
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <cstdlib>

#include "uv47.h"
#include "common/uuid_v7.h"

// Demo key used when no key source is configured. Never use a fixed key
// outside of examples.
constexpr const char *DEMO_KEY = "000102030405060708090a0b0c0d0e0f";

std::string
format_timestamp(uint64_t timestamp_ms) {
    auto time_point =
        std::chrono::system_clock::time_point(std::chrono::milliseconds(timestamp_ms));
    auto time_t = std::chrono::system_clock::to_time_t(time_point);

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << timestamp_ms % 1000 << " UTC";

    return ss.str();
}

int
main(int argc, char *argv[]) {
    uv47_params_t params;
    if (argc > 1) {
        params[uv47::KeyConfig::KEY_FILE_PARAM] = argv[1];
    }

    uv47::KeyConfig cfg(params);
    uv47::Key key;
    uv47_status_t status = cfg.load(key);
    if (status == UV47_ERR_NOT_FOUND && argc == 1) {
        std::cout << "No key in " << cfg.source() << ", using the demo key" << std::endl;
        status = uv47::Key::fromHex(DEMO_KEY, key);
    }
    if (status != UV47_SUCCESS) {
        std::cerr << "Failed to load key from " << cfg.source() << ": "
                  << uv47EnumStrings::statusStr(status) << std::endl;
        return EXIT_FAILURE;
    }

    for (int i = 0; i < 3; i++) {
        const uv47::UUIDv7 id;

        std::string facade;
        status = uv47::encodeStr(id.to_string(), key, facade);
        if (status != UV47_SUCCESS) {
            std::cerr << "encode failed: " << uv47EnumStrings::statusStr(status) << std::endl;
            return EXIT_FAILURE;
        }

        std::string decoded;
        status = uv47::decodeStr(facade, key, decoded);
        if (status != UV47_SUCCESS) {
            std::cerr << "decode failed: " << uv47EnumStrings::statusStr(status) << std::endl;
            return EXIT_FAILURE;
        }

        std::cout << "v7     " << id.to_string() << "  (" << format_timestamp(id.timestamp_ms())
                  << ")" << std::endl;
        std::cout << "facade " << facade << std::endl;
        std::cout << "decode " << decoded << (decoded == id.to_string() ? "  ok" : "  MISMATCH")
                  << std::endl;
    }

    return EXIT_SUCCESS;
}
