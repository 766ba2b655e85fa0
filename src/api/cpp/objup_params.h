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
#ifndef _OBJUP_PARAMS_H
#define _OBJUP_PARAMS_H

#include <chrono>
#include <cstdint>
#include <string>
#include "objup_types.h"

/**
 * @class objupConfig
 * @brief Engine wide configuration: part sizing, concurrency ceiling, retry budget and
 *        remote call deadlines.
 */
class objupConfig {
    public:
        static constexpr uint64_t kDefaultPartSize = 8 * OBJUP_MIB;
        static constexpr uint64_t kDefaultMinPartSize = 5 * OBJUP_MIB;
        static constexpr uint32_t kDefaultMaxPartCount = 10000;
        static constexpr uint64_t kDefaultPartAlignment = OBJUP_MIB;
        static constexpr uint32_t kDefaultMaxConcurrentParts = 10;
        static constexpr uint32_t kDefaultMaxRetryAttempts = 5;
        static constexpr std::chrono::milliseconds kDefaultRetryBaseDelay =
            std::chrono::milliseconds(200);
        static constexpr std::chrono::milliseconds kDefaultRetryMaxDelay =
            std::chrono::milliseconds(20000);
        static constexpr std::chrono::milliseconds kDefaultConnectTimeout =
            std::chrono::milliseconds(60000);
        static constexpr std::chrono::milliseconds kDefaultReadTimeout =
            std::chrono::milliseconds(300000);
        static constexpr std::chrono::seconds kDefaultPresignedUrlExpiry =
            std::chrono::seconds(3600);
        static constexpr std::chrono::seconds kMaxPresignedUrlExpiry =
            std::chrono::seconds(7 * 24 * 3600);
        static constexpr uint64_t kDefaultMaxSinglePartUploadSize = 5ULL * 1024 * OBJUP_MIB;

        /** @var Size of every part but the last one */
        uint64_t partSize = kDefaultPartSize;
        /** @var Smallest part the store accepts for a non-final part */
        uint64_t minPartSize = kDefaultMinPartSize;
        /** @var Largest part count the store accepts for one upload */
        uint32_t maxPartCount = kDefaultMaxPartCount;
        /** @var Recomputed part sizes are rounded up to a multiple of this */
        uint64_t partAlignment = kDefaultPartAlignment;
        /** @var Ceiling of parts in flight across all sessions of a coordinator */
        uint32_t maxConcurrentParts = kDefaultMaxConcurrentParts;
        /** @var Threads of the shared worker pool, 0 means one per concurrent part */
        uint32_t workerThreads = 0;
        /** @var Attempts per part, including the first one */
        uint32_t maxRetryAttempts = kDefaultMaxRetryAttempts;
        /** @var First backoff delay, doubled on every retry */
        std::chrono::milliseconds retryBaseDelay = kDefaultRetryBaseDelay;
        /** @var Backoff delay cap */
        std::chrono::milliseconds retryMaxDelay = kDefaultRetryMaxDelay;
        /** @var Deadline to establish a connection for one remote call */
        std::chrono::milliseconds connectTimeout = kDefaultConnectTimeout;
        /** @var Deadline to receive the response of one remote call */
        std::chrono::milliseconds readTimeout = kDefaultReadTimeout;
        /**
         * @var Expiry of presigned URLs. Not used by the upload engine itself, kept so a
         *      presigning collaborator reads the same configuration.
         */
        std::chrono::seconds presignedUrlExpiry = kDefaultPresignedUrlExpiry;
        /** @var Objects above this size cannot be sent with a single put */
        uint64_t maxSinglePartUploadSize = kDefaultMaxSinglePartUploadSize;

        /**
         * @brief  Default constructor.
         */
        objupConfig() = default;

        /**
         * @brief  Build a configuration from the defaults overridden by OBJUP_* environment
         *         variables. Throws std::runtime_error on a malformed value.
         */
        [[nodiscard]] static objupConfig
        fromEnv();

        /**
         * @brief  Check the values are usable together.
         * @param  reason  Filled with a description of the first violation
         * @return OBJUP_SUCCESS or OBJUP_ERR_INVALID_PARAM
         */
        [[nodiscard]] objup_status_t
        validate(std::string &reason) const;

        /**
         * @brief  Number of worker threads to start for the shared pool
         */
        [[nodiscard]] uint32_t
        effectiveWorkerThreads() const noexcept {
            return workerThreads ? workerThreads : maxConcurrentParts;
        }
};

#endif
