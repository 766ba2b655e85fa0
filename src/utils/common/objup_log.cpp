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

#include "objup_log.h"
#include "absl/log/initialize.h"
#include "absl/log/globals.h"
#include "absl/strings/ascii.h"
#include <cstdlib>
#include <string>

void
objupSetLogLevel(const std::string &level) {
    const std::string level_str = absl::AsciiStrToUpper(level);
    if (level_str == "TRACE") {
        absl::SetMinLogLevel(absl::LogSeverityAtLeast::kInfo);
        absl::SetVLogLevel("*", 2);
    } else if (level_str == "DEBUG") {
        absl::SetMinLogLevel(absl::LogSeverityAtLeast::kInfo);
        absl::SetVLogLevel("*", 1);
    } else if (level_str == "INFO") {
        absl::SetMinLogLevel(absl::LogSeverityAtLeast::kInfo);
        absl::SetVLogLevel("*", 0);
    } else if (level_str == "WARNING") {
        absl::SetMinLogLevel(absl::LogSeverityAtLeast::kWarning);
        absl::SetVLogLevel("*", 0);
    } else if (level_str == "ERROR") {
        absl::SetMinLogLevel(absl::LogSeverityAtLeast::kError);
        absl::SetVLogLevel("*", 0);
    } else if (level_str == "FATAL") {
        absl::SetMinLogLevel(absl::LogSeverityAtLeast::kFatal);
        absl::SetVLogLevel("*", 0);
    } else {
        absl::SetMinLogLevel(absl::LogSeverityAtLeast::kWarning);
        absl::SetVLogLevel("*", 0);
    }
}

namespace {

// Runs before main() via constructor attribute.
void InitializeObjupLogging() __attribute__((constructor));

void InitializeObjupLogging()
{
    absl::InitializeLog();

    const char* env_log_level = std::getenv("OBJUP_LOG_LEVEL");
    if (env_log_level != nullptr) {
        objupSetLogLevel(env_log_level);
        return;
    }

    #if defined(LOG_LEVEL_TRACE)
        objupSetLogLevel("TRACE");
    #elif defined(LOG_LEVEL_DEBUG)
        objupSetLogLevel("DEBUG");
    #elif defined(LOG_LEVEL_INFO)
        objupSetLogLevel("INFO");
    #elif defined(LOG_LEVEL_WARNING)
        objupSetLogLevel("WARNING");
    #elif defined(LOG_LEVEL_FATAL)
        objupSetLogLevel("FATAL");
    #else
        // LOG_LEVEL_ERROR, the OBJUP_LOG_LEVEL default in CMakeLists.txt
        objupSetLogLevel("ERROR");
    #endif
}

} // anonymous namespace
