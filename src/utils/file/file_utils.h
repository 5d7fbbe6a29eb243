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
#ifndef __FILE_UTILS_H
#define __FILE_UTILS_H

#include <string>
#include <string_view>
#include "uv47_types.h"

namespace uv47 {

/**
 * @brief Reads a small secret file (such as a key file) into a string
 *
 * Files readable by group or other are still read, with a warning.
 *
 * @param filename Path to read
 * @param contents Output, untouched on failure
 * @return UV47_SUCCESS, UV47_ERR_NOT_FOUND if the file cannot be opened,
 *         UV47_ERR_INVALID_PARAM for an empty name, a non-regular file or a
 *         file larger than max_size
 */
uv47_status_t
readSecretFile(std::string_view filename, std::string &contents, size_t max_size = 4096);

} // namespace uv47

#endif // __FILE_UTILS_H
