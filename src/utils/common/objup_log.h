/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
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
#ifndef __OBJUP_LOG_H
#define __OBJUP_LOG_H

#include <string>

#include "absl/log/log.h"
#include "absl/log/check.h"

/*
 * Apply a textual level (TRACE, DEBUG, INFO, WARNING, ERROR, FATAL) to the Abseil
 * minimum log level and verbosity. Unknown levels fall back to WARNING.
 * The OBJUP_LOG_LEVEL environment variable is applied this way before main().
 */
void
objupSetLogLevel(const std::string &level);

/*-----------------------------------------------------------------------------*
 * Logging Macros (Abseil Stream-style)
 *-----------------------------------------------------------------------------*
 * Usage: OBJUP_INFO << "Uploaded part " << part_number << " of " << key;
 */

/* Logs a message and terminates the program unconditionally. */
#define OBJUP_FATAL LOG(FATAL)

/* Logs messages unconditionally (Abseil ERROR level) */
#define OBJUP_ERROR LOG(ERROR)

/* Logs messages unconditionally (Abseil WARNING level) */
#define OBJUP_WARN LOG(WARNING)

/*
 * Abseil INFO level, controlled at runtime by OBJUP_LOG_LEVEL and at compile time
 * by ABSL_MIN_LOG_LEVEL.
 */
#define OBJUP_INFO LOG(INFO)

/* Debug builds only, verbosity 1 */
#define OBJUP_DEBUG DVLOG(1)

/* Debug builds only, verbosity 2. Per part chatter goes here. */
#define OBJUP_TRACE DVLOG(2)


/*-----------------------------------------------------------------------------*
 * Assertion Macros
 *-----------------------------------------------------------------------------*/

/* Checked in all builds, terminates if false. */
#define OBJUP_ASSERT_ALWAYS(condition) CHECK(condition)

/* Checked in debug builds only. */
#define OBJUP_ASSERT(condition) DCHECK(condition)

#endif /* __OBJUP_LOG_H */
