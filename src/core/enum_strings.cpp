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

std::string
uv47EnumStrings::statusStr(const uv47_status_t &status) {
    switch (status) {
    case UV47_SUCCESS:
        return "UV47_SUCCESS";
    case UV47_ERR_INVALID_LENGTH:
        return "UV47_ERR_INVALID_LENGTH";
    case UV47_ERR_INVALID_PARAM:
        return "UV47_ERR_INVALID_PARAM";
    case UV47_ERR_MISMATCH:
        return "UV47_ERR_MISMATCH";
    case UV47_ERR_NOT_FOUND:
        return "UV47_ERR_NOT_FOUND";
    case UV47_ERR_UNKNOWN:
        return "UV47_ERR_UNKNOWN";
    default:
        return "BAD_STATUS";
    }
}

std::string
uv47EnumStrings::fieldStr(const uv47_field_t &field) {
    switch (field) {
    case UV47_FIELD_RAND_A:
        return "RAND_A";
    case UV47_FIELD_RAND_B:
        return "RAND_B";
    default:
        return "BAD_FIELD";
    }
}
