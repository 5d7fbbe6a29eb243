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
#include "uv47_log.h"
#include "absl/log/initialize.h"
#include "absl/log/globals.h"
#include "absl/strings/ascii.h"
#include "absl/container/flat_hash_map.h"
#include <cstdlib>
#include <string>
#include <string_view>

namespace {

struct LogLevelSettings {
    absl::LogSeverityAtLeast min_severity;
    int vlog_level;
};

constexpr std::string_view kDefaultLogLevel = "WARN";
constexpr const char *kLogLevelVar = "UV47_LOG_LEVEL";

const absl::flat_hash_map<std::string, LogLevelSettings> &
logLevelMap() {
    static const absl::flat_hash_map<std::string, LogLevelSettings> kLogLevelMap = {
        {"TRACE", {absl::LogSeverityAtLeast::kInfo, 2}},
        {"DEBUG", {absl::LogSeverityAtLeast::kInfo, 1}},
        {"INFO", {absl::LogSeverityAtLeast::kInfo, 0}},
        {"WARN", {absl::LogSeverityAtLeast::kWarning, 0}},
        {"ERROR", {absl::LogSeverityAtLeast::kError, 0}},
        {"FATAL", {absl::LogSeverityAtLeast::kFatal, 0}},
    };
    return kLogLevelMap;
}

// Runs before main() so the level is in place for static initializers too
void InitializeUv47Logging() __attribute__((constructor));

void
InitializeUv47Logging() {
    absl::InitializeLog();

    const char *env_log_level = std::getenv(kLogLevelVar);
    if (env_log_level != nullptr && uv47::setLogLevel(env_log_level) == UV47_SUCCESS) {
        return;
    }

    const uv47_status_t status = uv47::setLogLevel(kDefaultLogLevel);
    UV47_ASSERT(status == UV47_SUCCESS);
    if (env_log_level != nullptr) {
        UV47_WARN << "Invalid " << kLogLevelVar
                  << " environment variable, using default log level: " << kDefaultLogLevel;
    }
}

} // anonymous namespace

namespace uv47 {

uv47_status_t
setLogLevel(std::string_view level) {
    const auto &levels = logLevelMap();
    auto it = levels.find(absl::AsciiStrToUpper(level));
    if (it == levels.end()) {
        return UV47_ERR_INVALID_PARAM;
    }

    absl::SetMinLogLevel(it->second.min_severity);
    absl::SetVLogLevel("*", it->second.vlog_level);
    absl::SetStderrThreshold(it->second.min_severity);
    return UV47_SUCCESS;
}

} // namespace uv47
