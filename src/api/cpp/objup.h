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
/**
 * @file objup.h
 * @brief objup core API: concurrent multipart uploads to S3-compatible object stores
 */
#ifndef _OBJUP_H
#define _OBJUP_H

#include <memory>
#include <string>

#include "objup_types.h"
#include "objup_params.h"
#include "objup_data_source.h"
#include "store/object_store.h"

class objupCoordinatorData;

/**
 * @struct objupUploadRequest
 * @brief  Everything needed to start one upload
 */
struct objupUploadRequest {
    /** @var Object key, sanitized before use */
    std::string key;
    /** @var Bytes to upload, kept alive by the coordinator until the upload is final */
    std::shared_ptr<const objupDataSource> source;
    /** @var Expected size, 0 to take the size of the source */
    uint64_t sizeHint = 0;
    objupUploadOptions options;
    /** @var Continue this multipart upload instead of starting a new one */
    std::string resumeUploadId;
};

/**
 * @class objupTransferCoordinator
 * @brief Runs uploads concurrently. Parts of every upload share one worker pool and one
 *        ceiling of parts in flight (objupConfig::maxConcurrentParts).
 */
class objupTransferCoordinator {
    private:
        /** @var Private coordinator state */
        std::unique_ptr<objupCoordinatorData> data;

    public:
        /**
         * @brief Constructor. Throws std::invalid_argument for a null store or a
         *        configuration that does not validate.
         * @param store Object store shared by every upload
         * @param cfg   Engine configuration
         */
        objupTransferCoordinator(std::shared_ptr<iObjectStore> store,
                                 const objupConfig &cfg = objupConfig());
        /**
         * @brief Destructor. Cancels the uploads still running and waits for them.
         */
        ~objupTransferCoordinator();

        objupTransferCoordinator(const objupTransferCoordinator &) = delete;
        objupTransferCoordinator &
        operator=(const objupTransferCoordinator &) = delete;

        /**
         * @brief  Plan and start an upload in the background.
         *         Objects below twice the minimum part size are sent with a single put.
         *         Every handle must be awaited: the outcome of an upload is kept until then.
         *         The driver thread and the source of a finished upload are released by
         *         the next submit, or by await() of its handle.
         * @param  request  Key, source and options of the upload
         * @param  handle   Handle of the started upload
         * @return OBJUP_SUCCESS, OBJUP_ERR_INVALID_PARAM for a bad key or missing source,
         *         OBJUP_ERR_MISMATCH when sizeHint disagrees with the source, or a planning error
         */
        objup_status_t
        submit(const objupUploadRequest &request, objup_handle_t &handle);

        /**
         * @brief  Shorthand for submit()
         */
        objup_status_t
        startUpload(const std::string &key,
                    std::shared_ptr<const objupDataSource> source,
                    uint64_t size_hint,
                    const objupUploadOptions &options,
                    objup_handle_t &handle);

        /**
         * @brief  Snapshot of the bytes and parts stored so far. Never waits for parts.
         * @return OBJUP_SUCCESS or OBJUP_ERR_NOT_FOUND
         */
        objup_status_t
        progress(objup_handle_t handle, objupProgress &progress) const;

        /**
         * @brief  Stop dispatching parts of an upload. Parts in flight are awaited, then
         *         the remote upload is aborted. Has no effect once completion has started.
         *         The handle stays valid, await() it to collect the outcome.
         * @return OBJUP_SUCCESS or OBJUP_ERR_NOT_FOUND
         */
        objup_status_t
        cancel(objup_handle_t handle);

        /**
         * @brief  Wait for an upload to reach a final state and release its handle.
         * @param  outcome  Final state, object version or error context
         * @return outcome.status, or OBJUP_ERR_NOT_FOUND for an unknown handle
         */
        objup_status_t
        await(objup_handle_t handle, objupUploadOutcome &outcome);

        /**
         * @brief  Number of uploads not in a final state yet
         */
        size_t
        activeCount() const;

        /**
         * @brief  Highest number of parts that were in flight at the same time
         */
        uint32_t
        peakPartsInFlight() const;

        const objupConfig &
        getConfig() const;
};

#endif
