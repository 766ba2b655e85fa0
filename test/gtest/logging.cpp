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

#include <gtest/gtest.h>

#include <absl/log/globals.h>

#include "common/objup_log.h"

namespace gtest {
namespace logging {

class LogLevelTest : public ::testing::Test {
protected:
    LogLevelTest() : minLevel_(absl::MinLogLevel()) {}

    ~LogLevelTest() override {
        absl::SetMinLogLevel(minLevel_);
    }

    // Puts the saved verbosity back and returns the one the test left behind
    int
    restoreVLogLevel() {
        return absl::SetVLogLevel("*", vlogLevel_);
    }

    void
    SetUp() override {
        vlogLevel_ = absl::SetVLogLevel("*", 0);
        absl::SetVLogLevel("*", vlogLevel_);
    }

    absl::LogSeverityAtLeast minLevel_;
    int vlogLevel_ = 0;
};

TEST_F(LogLevelTest, SeverityLevels) {
    objupSetLogLevel("WARNING");
    EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kWarning);
    EXPECT_EQ(restoreVLogLevel(), 0);

    objupSetLogLevel("ERROR");
    EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kError);

    objupSetLogLevel("FATAL");
    EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kFatal);
}

TEST_F(LogLevelTest, VerboseLevels) {
    objupSetLogLevel("trace");
    EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kInfo);
    EXPECT_EQ(restoreVLogLevel(), 2);

    objupSetLogLevel("Debug");
    EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kInfo);
    EXPECT_EQ(restoreVLogLevel(), 1);

    objupSetLogLevel("info");
    EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kInfo);
    EXPECT_EQ(restoreVLogLevel(), 0);
}

TEST_F(LogLevelTest, UnknownLevelFallsBackToWarning) {
    objupSetLogLevel("chatty");
    EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kWarning);
    EXPECT_EQ(restoreVLogLevel(), 0);
}

} // namespace logging
} // namespace gtest
