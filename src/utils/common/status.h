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

#ifndef STATUS_H
#define STATUS_H

#include <absl/log/log.h>
#include <absl/strings/str_format.h>
#include "uv47.h"
#include "uv47_log.h"

#define UV47_LOG_AND_RETURN_IF_ERROR(status, message) \
    do { \
        if ((status) != UV47_SUCCESS) { \
            UV47_ERROR << absl::StrFormat("Error: %s - %s", \
                                          uv47EnumStrings::statusStr(status), (message)); \
            return (status); \
        } \
    } while (0)

#endif /* STATUS_H */
