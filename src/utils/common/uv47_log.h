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
#ifndef __UV47_LOG_H
#define __UV47_LOG_H

#include "absl/log/log.h"
#include "absl/log/check.h"
#include "absl/log/initialize.h"
#include <string_view>
#include "uv47_types.h"

/*-----------------------------------------------------------------------------*
 * Logging Macros (Abseil Stream-style)
 *-----------------------------------------------------------------------------*
 * Ordered by severity (highest to lowest)
 * Usage: UV47_INFO << "Loaded key from " << source;
 *
 * Key material must never be streamed into any of these.
 */

/*
 * Logs a message and terminates the program unconditionally.
 * Maps to Abseil LOG(FATAL). Use for unrecoverable errors.
 */
#define UV47_FATAL LOG(FATAL)

/* Logs messages unconditionally (maps to Abseil ERROR level) */
#define UV47_ERROR LOG(ERROR)

/* Logs messages unconditionally (maps to Abseil WARNING level) */
#define UV47_WARN LOG(WARNING)

/* Logs messages unconditionally (maps to Abseil INFO level) */
#define UV47_INFO LOG(INFO)

/* Maps to Abseil verbosity level 1 */
#define UV47_DEBUG VLOG(1)

/*
 * Maps to Abseil verbosity level 2.
 * Stripped from release builds.
 */
#define UV47_TRACE DVLOG(2)

/*-----------------------------------------------------------------------------*
 * Assertion Macros
 *-----------------------------------------------------------------------------*/

/*
 * Check condition in all builds (debug and release). For critical invariants.
 * Terminates program if condition is false.
 *      UV47_ASSERT_ALWAYS(len == 16) << "Bad length " << len;
 */
#define UV47_ASSERT_ALWAYS(condition) CHECK(condition)

/*
 * Check condition in debug builds only.
 * Terminates program if condition is false.
 */
#define UV47_ASSERT(condition) DCHECK(condition)

namespace uv47 {

/*
 * Applies one of TRACE, DEBUG, INFO, WARN, ERROR, FATAL (any case).
 * The level is read from UV47_LOG_LEVEL before main(), default WARN.
 * Returns UV47_ERR_INVALID_PARAM and leaves the level alone otherwise.
 */
uv47_status_t
setLogLevel(std::string_view level);

} // namespace uv47

#endif /* __UV47_LOG_H */
