/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef OBJUP_CORE_PART_UPLOADER_H
#define OBJUP_CORE_PART_UPLOADER_H

#include <memory>
#include <string>

#include "objup_types.h"
#include "objup_data_source.h"
#include "store/object_store.h"
#include "retry_policy.h"

/**
 * Uploads one part (or a whole small object) with retries. Holds no per session state,
 * one instance is shared by every session of a coordinator.
 */
class objupPartUploader {
public:
    explicit objupPartUploader(std::shared_ptr<iObjectStore> store, objupSleepFn sleep = {});

    /**
     * Read task.byteRange from source and upload it as part task.partNumber of ref.
     * Transient failures are retried under policy, task.attempt is advanced for every try.
     *
     * @return OBJUP_SUCCESS with result filled, OBJUP_ERR_DATA_SOURCE when the bytes cannot
     *         be read, OBJUP_ERR_CANCELED when stop fired between attempts, or the last
     *         remote error
     */
    [[nodiscard]] objup_status_t
    uploadPart(const objupSessionRef &ref,
               objupPartTask &task,
               const objupDataSource &source,
               const objupBackoffPolicy &policy,
               objupPartResult &result,
               const objupStopFn &stop = {}) const;

    /**
     * Send the whole of source with a single put, retried like a part.
     */
    [[nodiscard]] objup_status_t
    putObject(const std::string &key,
              const objupObjectAttributes &attributes,
              const objupDataSource &source,
              const objupBackoffPolicy &policy,
              std::string &etag,
              const objupStopFn &stop = {}) const;

    [[nodiscard]] iObjectStore &
    store() const noexcept {
        return *store_;
    }

    /** Sleep used between attempts, empty for objupDefaultSleep */
    [[nodiscard]] const objupSleepFn &
    sleeper() const noexcept {
        return sleep_;
    }

private:
    std::shared_ptr<iObjectStore> store_;
    objupSleepFn sleep_;
};

#endif // OBJUP_CORE_PART_UPLOADER_H
