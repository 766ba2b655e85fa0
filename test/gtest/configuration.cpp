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

#include "common/config.h"
#include "common.h"
#include "objup_params.h"
#include "gtest/gtest.h"

#include <chrono>
#include <limits>
#include <stdexcept>
#include <stdlib.h>
#include <string>

namespace gtest {

namespace {

    const std::string variable = "OBJUP_CONFIG_TEST";
    const std::string undefined = "ASDLFHASLK1298159816";

} // namespace

TEST(Config, EnvWrapper) {
    const std::string value = "foo";
    ASSERT_EQ(::setenv(variable.c_str(), value.c_str(), 1), 0);
    ASSERT_EQ(objup::config::getenvOptional(variable), value);
    ASSERT_FALSE(objup::config::getenvOptional(undefined).has_value());
}

TEST(Config, Undefined) {
    ASSERT_EQ(objup::config::getValueDefaulted<bool>(undefined, true), true);
    ASSERT_EQ(objup::config::getValueDefaulted<bool>(undefined, false), false);
    ASSERT_EQ(objup::config::getValueDefaulted<char>(undefined, 42), 42);
    const std::string value = "foo";
    ASSERT_EQ(objup::config::getValueDefaulted<std::string>(undefined, value), value);
}

namespace {

    template<typename T>
    void
    testSimpleSuccess(const std::string &input, const T value) {
        ASSERT_EQ(::setenv(variable.c_str(), input.c_str(), 1), 0);
        EXPECT_EQ(objup::config::getValueDefaulted<T>(variable, !value), value);
        EXPECT_EQ(objup::config::getValueDefaulted<std::string>(variable, variable), input);
    }

    template<typename T>
    void
    testSimpleFailure(const std::string &input) {
        ASSERT_EQ(::setenv(variable.c_str(), input.c_str(), 1), 0);
        EXPECT_ANY_THROW((void)objup::config::getValueDefaulted<T>(variable, T()));
        EXPECT_EQ(objup::config::getValueDefaulted<std::string>(variable, variable), input);
    }

} // namespace

TEST(Config, ConvertBool) {
    testSimpleSuccess("1", true);
    testSimpleSuccess("0", false);
    testSimpleSuccess("yes", true);
    testSimpleSuccess("no", false);
    testSimpleSuccess("Yes", true);
    testSimpleSuccess("No", false);
    testSimpleSuccess("YeS", true);
    testSimpleSuccess("nO", false);
    testSimpleSuccess("enable", true);
    testSimpleSuccess("disable", false);
    testSimpleSuccess("on", true);
    testSimpleSuccess("off", false);
    testSimpleSuccess("oN", true);
    testSimpleSuccess("oFF", false);
    testSimpleSuccess("TRUE", true);
    testSimpleSuccess("FALSE", false);
    testSimpleSuccess("true", true);
    testSimpleSuccess("false", false);

    testSimpleFailure<bool>("");
    testSimpleFailure<bool>("2");
    testSimpleFailure<bool>("enabled");
}

namespace {
    template<typename T>
    void
    testSigned() {
        testSimpleSuccess("0", T(0));
        testSimpleSuccess("1", T(1));
        testSimpleSuccess("-1", T(-1));
        testSimpleSuccess("42", T(42));
        testSimpleSuccess("-42", T(-42));
        const T min_value = std::numeric_limits<T>::min();
        const std::string min_string = std::to_string(min_value);
        testSimpleSuccess(min_string, min_value);
        const T max_value = std::numeric_limits<T>::max();
        const std::string max_string = std::to_string(max_value);
        testSimpleSuccess(max_string, max_value);

        testSimpleFailure<T>("");
        testSimpleFailure<T>("-");
        testSimpleFailure<T>("+");
        testSimpleFailure<T>("+0");
        testSimpleFailure<T>("+1");
        testSimpleFailure<T>("r");
        testSimpleFailure<T>("0y");
        testSimpleFailure<T>("0x");
        testSimpleFailure<T>(max_string + '0');
        testSimpleFailure<T>(min_string + '0');

        testSimpleFailure<T>("0x0");
        testSimpleFailure<T>("0x000");
        testSimpleFailure<T>("0x01");
        testSimpleFailure<T>("0x1f");
        testSimpleFailure<T>("-0x01");
    }

    template<typename T>
    void
    testUnsigned() {
        testSimpleSuccess("0", T(0));
        testSimpleSuccess("1", T(1));
        testSimpleSuccess("42", T(42));
        const T max_value = std::numeric_limits<T>::max();
        const std::string max_string = std::to_string(max_value);
        testSimpleSuccess(max_string, max_value);

        testSimpleFailure<T>("");
        testSimpleFailure<T>(" 0");
        testSimpleFailure<T>("0 ");
        testSimpleFailure<T>("-");
        testSimpleFailure<T>("+");
        testSimpleFailure<T>("-1");
        testSimpleFailure<T>("+1");
        testSimpleFailure<T>("-m");
        testSimpleFailure<T>("r");
        testSimpleFailure<T>("0y");
        testSimpleFailure<T>("0x");
        testSimpleFailure<T>(max_string + '0');

        testSimpleSuccess<T>("0x0", T(0));
        testSimpleSuccess<T>("0x000", T(0));
        testSimpleSuccess<T>("0x01", T(1));
        testSimpleSuccess<T>("0x1f", T(31));

        testSimpleFailure<T>("+0x00");
    }

} // namespace

TEST(Config, ConvertSigned) {
    testSigned<std::int8_t>();
    testSigned<std::int16_t>();
    testSigned<std::int32_t>();
    testSigned<std::int64_t>();
}

TEST(Config, ConvertUnsigned) {
    testUnsigned<std::uint8_t>();
    testUnsigned<std::uint16_t>();
    testUnsigned<std::uint32_t>();
    testUnsigned<std::uint64_t>();
}

TEST(Config, ConvertDuration) {
    ASSERT_EQ(::setenv(variable.c_str(), "250", 1), 0);
    EXPECT_EQ(objup::config::getValueDefaulted(variable, std::chrono::milliseconds(0)),
              std::chrono::milliseconds(250));

    ASSERT_EQ(::setenv(variable.c_str(), "soon", 1), 0);
    EXPECT_THROW((void)objup::config::getValueDefaulted(variable, std::chrono::seconds(7)),
                 std::runtime_error);
    EXPECT_EQ(objup::config::getValueDefaulted(undefined, std::chrono::seconds(7)),
              std::chrono::seconds(7));
}

TEST(Config, EngineDefaults) {
    const objupConfig cfg;
    EXPECT_EQ(cfg.partSize, 8 * OBJUP_MIB);
    EXPECT_EQ(cfg.minPartSize, 5 * OBJUP_MIB);
    EXPECT_EQ(cfg.maxPartCount, 10000u);
    EXPECT_EQ(cfg.maxConcurrentParts, 10u);
    EXPECT_EQ(cfg.maxRetryAttempts, 5u);
    EXPECT_EQ(cfg.retryBaseDelay, std::chrono::milliseconds(200));
    EXPECT_EQ(cfg.retryMaxDelay, std::chrono::seconds(20));
    EXPECT_EQ(cfg.connectTimeout, std::chrono::seconds(60));
    EXPECT_EQ(cfg.readTimeout, std::chrono::seconds(300));
    EXPECT_EQ(cfg.presignedUrlExpiry, std::chrono::seconds(3600));
    EXPECT_EQ(cfg.effectiveWorkerThreads(), cfg.maxConcurrentParts);

    std::string reason;
    EXPECT_EQ(cfg.validate(reason), OBJUP_SUCCESS) << reason;
}

TEST(Config, EngineFromEnv) {
    ScopedEnv env;
    env.addVar("OBJUP_PART_SIZE", "16777216");
    env.addVar("OBJUP_MAX_CONCURRENT_PARTS", "4");
    env.addVar("OBJUP_WORKER_THREADS", "2");
    env.addVar("OBJUP_MAX_RETRY_ATTEMPTS", "3");
    env.addVar("OBJUP_RETRY_BASE_DELAY_MS", "50");
    env.addVar("OBJUP_READ_TIMEOUT_MS", "1000");
    env.addVar("OBJUP_PRESIGNED_URL_EXPIRY_S", "60");

    const objupConfig cfg = objupConfig::fromEnv();
    EXPECT_EQ(cfg.partSize, 16 * OBJUP_MIB);
    EXPECT_EQ(cfg.maxConcurrentParts, 4u);
    EXPECT_EQ(cfg.effectiveWorkerThreads(), 2u);
    EXPECT_EQ(cfg.maxRetryAttempts, 3u);
    EXPECT_EQ(cfg.retryBaseDelay, std::chrono::milliseconds(50));
    EXPECT_EQ(cfg.readTimeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.presignedUrlExpiry, std::chrono::seconds(60));
    EXPECT_EQ(cfg.minPartSize, objupConfig::kDefaultMinPartSize);
}

TEST(Config, EngineFromEnvMalformed) {
    ScopedEnv env;
    env.addVar("OBJUP_MAX_CONCURRENT_PARTS", "-4");
    EXPECT_ANY_THROW((void)objupConfig::fromEnv());
}

TEST(Config, EngineValidate) {
    std::string reason;

    objupConfig cfg;
    cfg.partSize = cfg.minPartSize - 1;
    EXPECT_EQ(cfg.validate(reason), OBJUP_ERR_INVALID_PARAM);
    EXPECT_FALSE(reason.empty());

    cfg = objupConfig();
    cfg.maxConcurrentParts = 0;
    EXPECT_EQ(cfg.validate(reason), OBJUP_ERR_INVALID_PARAM);

    cfg = objupConfig();
    cfg.maxRetryAttempts = 0;
    EXPECT_EQ(cfg.validate(reason), OBJUP_ERR_INVALID_PARAM);

    cfg = objupConfig();
    cfg.retryMaxDelay = cfg.retryBaseDelay - std::chrono::milliseconds(1);
    EXPECT_EQ(cfg.validate(reason), OBJUP_ERR_INVALID_PARAM);

    cfg = objupConfig();
    cfg.presignedUrlExpiry = objupConfig::kMaxPresignedUrlExpiry + std::chrono::seconds(1);
    EXPECT_EQ(cfg.validate(reason), OBJUP_ERR_INVALID_PARAM);
}

} // namespace gtest
