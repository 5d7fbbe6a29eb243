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
#include "file_utils.h"
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <errno.h>
#include <cstring>

#include "common/uv47_log.h"

namespace uv47 {

uv47_status_t
readSecretFile(std::string_view filename, std::string &contents, size_t max_size) {
    if (filename.empty()) {
        return UV47_ERR_INVALID_PARAM;
    }

    const std::string path(filename);
    struct stat stat_buf;
    if (stat(path.c_str(), &stat_buf) != 0) {
        UV47_ERROR << "Cannot stat " << path << ": " << strerror(errno);
        return UV47_ERR_NOT_FOUND;
    }

    if (!S_ISREG(stat_buf.st_mode)) {
        UV47_ERROR << path << " is not a regular file";
        return UV47_ERR_INVALID_PARAM;
    }

    if (static_cast<size_t>(stat_buf.st_size) > max_size) {
        UV47_ERROR << path << " is " << stat_buf.st_size << " bytes, limit is " << max_size;
        return UV47_ERR_INVALID_PARAM;
    }

    if (stat_buf.st_mode & (S_IRWXG | S_IRWXO)) {
        UV47_WARN << "Secret file " << path << " is accessible by group or other users";
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        UV47_ERROR << "Cannot open " << path;
        return UV47_ERR_NOT_FOUND;
    }

    contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return UV47_SUCCESS;
}

} // namespace uv47
