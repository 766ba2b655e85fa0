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
#ifndef _OBJUP_TYPES_H
#define _OBJUP_TYPES_H

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>


/*** Forward declarations ***/
class objupDataSource;
class objupUploadSession;
class objupTransferCoordinator;
class iObjectStore;


/*** objup status and state enums ***/

/**
 * @enum   objupStatus
 * @brief  An enumeration of status values and error codes for objup
 */
enum objupStatus {
    OBJUP_IN_PROG = 1,
    OBJUP_SUCCESS = 0,
    OBJUP_ERR_INVALID_PARAM = -1,
    OBJUP_ERR_SIZE_TOO_SMALL = -2,
    OBJUP_ERR_TOO_MANY_PARTS = -3,
    OBJUP_ERR_REMOTE_TRANSIENT = -4,
    OBJUP_ERR_REMOTE_PERMANENT = -5,
    OBJUP_ERR_INITIATION_FAILED = -6,
    OBJUP_ERR_INCOMPLETE_PART_SET = -7,
    OBJUP_ERR_PARTIAL_UPLOAD = -8,
    OBJUP_ERR_ABORT_INCOMPLETE = -9,
    OBJUP_ERR_CANCELED = -10,
    OBJUP_ERR_NOT_FOUND = -11,
    OBJUP_ERR_NOT_ALLOWED = -12,
    OBJUP_ERR_MISMATCH = -13,
    OBJUP_ERR_DATA_SOURCE = -14
};
using objup_status_t = objupStatus;

/**
 * @enum   objupErrorCategory
 * @brief  Coarse grouping of status codes, used to decide who has to act on an error
 */
enum class objupErrorCategory {
    NONE,
    PLANNING,           // local size / part-count violation, never retried
    TRANSIENT_REMOTE,   // network, 5xx, throttling; retried by the part uploader
    PERMANENT_REMOTE,   // auth, 4xx; surfaced immediately
    PARTIAL_UPLOAD,     // parts stored remotely, caller must complete or abort
    ABORT_INCOMPLETE,   // remote abort failed, a sweep has to clean up
    LOCAL
};

/**
 * @enum   objupSessionState
 * @brief  Lifecycle of a multipart upload session. Completed, Aborted and Failed are final.
 */
enum class objupSessionState {
    INITIATING,
    IN_PROGRESS,
    COMPLETING,
    COMPLETED,
    ABORTING,
    ABORTED,
    FAILED
};
using objup_session_state_t = objupSessionState;

/**
 * @namespace objupEnumStrings
 * @brief     String representation of objup enums
 */
namespace objupEnumStrings {
std::string
statusStr(const objupStatus &status);
std::string
sessionStateStr(const objupSessionState &state);
std::string
errorCategoryStr(const objupErrorCategory &category);
} // namespace objupEnumStrings

[[nodiscard]] objupErrorCategory
objupCategoryOf(objup_status_t status) noexcept;

[[nodiscard]] inline bool
objupIsTerminal(objup_session_state_t state) noexcept {
    return state == objupSessionState::COMPLETED || state == objupSessionState::ABORTED ||
        state == objupSessionState::FAILED;
}


/*** objup aliases and plain data types used in the API ***/

/**
 * @brief Backend parameters of an object store (bucket, region, credentials, ...)
 */
using objupBParams = std::unordered_map<std::string, std::string>;
using objup_b_params_t = objupBParams;

/**
 * @brief User metadata attached to an uploaded object, without the x-amz-meta- prefix
 */
using objupMetadata = std::map<std::string, std::string>;
using objup_metadata_t = objupMetadata;

/**
 * @brief Opaque identifier of an upload submitted to an objupTransferCoordinator
 */
using objup_handle_t = uint64_t;

constexpr objup_handle_t OBJUP_INVALID_HANDLE = 0;

constexpr uint64_t OBJUP_MIB = 1024ULL * 1024;

/**
 * @struct objupUploadPlan
 * @brief  Split of an object into parts. Every part except the last is partSize bytes,
 *         the last one is totalSize - partSize * (partCount - 1) and never empty.
 */
struct objupUploadPlan {
    uint64_t totalSize = 0;
    uint64_t partSize = 0;
    uint32_t partCount = 0;

    [[nodiscard]] uint64_t
    lastPartSize() const noexcept {
        return partCount == 0 ? 0 : totalSize - partSize * (partCount - 1);
    }
};

/**
 * @struct objupByteRange
 * @brief  Half open byte interval [start, end) of the source object
 */
struct objupByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    [[nodiscard]] uint64_t
    length() const noexcept {
        return end - start;
    }
};

/**
 * @struct objupPartTask
 * @brief  One part to upload. Part numbers are 1-based and contiguous within a session,
 *         attempt counts the uploads already tried for this part.
 */
struct objupPartTask {
    uint32_t partNumber = 0;
    objupByteRange byteRange;
    uint32_t attempt = 0;
};

/**
 * @struct objupPartResult
 * @brief  Outcome of a successful part upload
 */
struct objupPartResult {
    uint32_t partNumber = 0;
    std::string eTag;
    uint64_t sizeUploaded = 0;
};

/**
 * @struct objupSessionRef
 * @brief  Identity of a remote multipart upload, all a part upload needs to know about it
 */
struct objupSessionRef {
    std::string key;
    std::string uploadId;
};

/**
 * @struct objupProgress
 * @brief  Point in time view of an upload
 */
struct objupProgress {
    uint64_t bytesCompleted = 0;
    uint64_t bytesTotal = 0;
    uint32_t partsCompleted = 0;
    uint32_t partsTotal = 0;
    objup_session_state_t state = objupSessionState::INITIATING;
};

/**
 * @struct objupUploadOptions
 * @brief  Per upload options supplied by the caller
 */
struct objupUploadOptions {
    /** @var Content-Type of the object, empty to let the store decide */
    std::string contentType;
    /** @var Cache-Control header of the object */
    std::string cacheControl;
    /** @var User metadata */
    objup_metadata_t metadata;
    /** @var Part size override, 0 to use the coordinator configuration */
    uint64_t partSize = 0;
};

/**
 * @struct objupObjectAttributes
 * @brief  Normalized attributes sent with the initiate / put call
 */
struct objupObjectAttributes {
    std::string contentType;
    std::string cacheControl;
    objup_metadata_t metadata;
};

/**
 * @struct objupUploadOutcome
 * @brief  Final result of an upload, with enough context to decide between re-attempting
 *         completion, aborting, or leaving orphaned parts for a cleanup sweep.
 */
struct objupUploadOutcome {
    objup_status_t status = OBJUP_IN_PROG;
    objup_session_state_t state = objupSessionState::INITIATING;
    std::string key;
    std::string uploadId;
    std::string objectVersion;
    uint32_t partsCompleted = 0;
    uint32_t partsTotal = 0;
    uint64_t bytesCompleted = 0;
    /** @var Set when the session tried to abort remotely and that call failed */
    bool remoteAbortFailed = false;
    std::string message;
};

#endif
