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

#include "objup_params.h"
#include "common/config.h"
#include "common/objup_log.h"

#include <absl/strings/str_format.h>

namespace {

const std::string partSizeVar = "OBJUP_PART_SIZE";
const std::string minPartSizeVar = "OBJUP_MIN_PART_SIZE";
const std::string maxPartCountVar = "OBJUP_MAX_PART_COUNT";
const std::string partAlignmentVar = "OBJUP_PART_ALIGNMENT";
const std::string maxConcurrentPartsVar = "OBJUP_MAX_CONCURRENT_PARTS";
const std::string workerThreadsVar = "OBJUP_WORKER_THREADS";
const std::string maxRetryAttemptsVar = "OBJUP_MAX_RETRY_ATTEMPTS";
const std::string retryBaseDelayVar = "OBJUP_RETRY_BASE_DELAY_MS";
const std::string retryMaxDelayVar = "OBJUP_RETRY_MAX_DELAY_MS";
const std::string connectTimeoutVar = "OBJUP_CONNECT_TIMEOUT_MS";
const std::string readTimeoutVar = "OBJUP_READ_TIMEOUT_MS";
const std::string presignedUrlExpiryVar = "OBJUP_PRESIGNED_URL_EXPIRY_S";

} // namespace

objupConfig
objupConfig::fromEnv() {
    namespace cfg = objup::config;
    objupConfig c;

    c.partSize = cfg::getValueDefaulted<uint64_t>(partSizeVar, c.partSize);
    c.minPartSize = cfg::getValueDefaulted<uint64_t>(minPartSizeVar, c.minPartSize);
    c.maxPartCount = cfg::getValueDefaulted<uint32_t>(maxPartCountVar, c.maxPartCount);
    c.partAlignment = cfg::getValueDefaulted<uint64_t>(partAlignmentVar, c.partAlignment);
    c.maxConcurrentParts =
        cfg::getValueDefaulted<uint32_t>(maxConcurrentPartsVar, c.maxConcurrentParts);
    c.workerThreads = cfg::getValueDefaulted<uint32_t>(workerThreadsVar, c.workerThreads);
    c.maxRetryAttempts = cfg::getValueDefaulted<uint32_t>(maxRetryAttemptsVar, c.maxRetryAttempts);
    c.retryBaseDelay = cfg::getValueDefaulted(retryBaseDelayVar, c.retryBaseDelay);
    c.retryMaxDelay = cfg::getValueDefaulted(retryMaxDelayVar, c.retryMaxDelay);
    c.connectTimeout = cfg::getValueDefaulted(connectTimeoutVar, c.connectTimeout);
    c.readTimeout = cfg::getValueDefaulted(readTimeoutVar, c.readTimeout);
    c.presignedUrlExpiry = cfg::getValueDefaulted(presignedUrlExpiryVar, c.presignedUrlExpiry);

    OBJUP_DEBUG << absl::StrFormat(
        "objup configuration: part_size=%d min_part_size=%d max_parts=%d concurrency=%d "
        "attempts=%d",
        c.partSize,
        c.minPartSize,
        c.maxPartCount,
        c.maxConcurrentParts,
        c.maxRetryAttempts);
    return c;
}

objup_status_t
objupConfig::validate(std::string &reason) const {
    if (minPartSize == 0) {
        reason = "minimum part size must be positive";
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (partSize < minPartSize) {
        reason = absl::StrFormat(
            "part size %d is below the minimum part size %d", partSize, minPartSize);
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (maxPartCount == 0) {
        reason = "maximum part count must be positive";
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (partAlignment == 0) {
        reason = "part alignment must be positive";
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (maxConcurrentParts == 0) {
        reason = "at least one concurrent part is required";
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (maxRetryAttempts == 0) {
        reason = "at least one attempt per part is required";
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (retryBaseDelay.count() < 0 || retryMaxDelay < retryBaseDelay) {
        reason = "retry delays must satisfy 0 <= base <= max";
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (presignedUrlExpiry.count() <= 0 || presignedUrlExpiry > kMaxPresignedUrlExpiry) {
        reason = absl::StrFormat("presigned URL expiry must be in (0, %d] seconds",
                                 kMaxPresignedUrlExpiry.count());
        return OBJUP_ERR_INVALID_PARAM;
    }
    return OBJUP_SUCCESS;
}
