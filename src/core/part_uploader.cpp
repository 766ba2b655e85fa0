/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "part_uploader.h"

#include <stdexcept>
#include <string_view>
#include <vector>

#include <absl/strings/str_format.h>

#include "common/objup_log.h"

objupPartUploader::objupPartUploader(std::shared_ptr<iObjectStore> store, objupSleepFn sleep)
    : store_(std::move(store)),
      sleep_(std::move(sleep)) {
    if (!store_) {
        throw std::invalid_argument("part uploader needs an object store");
    }
}

objup_status_t
objupPartUploader::uploadPart(const objupSessionRef &ref,
                              objupPartTask &task,
                              const objupDataSource &source,
                              const objupBackoffPolicy &policy,
                              objupPartResult &result,
                              const objupStopFn &stop) const {
    const uint64_t len = task.byteRange.length();
    if (len == 0 || task.partNumber == 0) {
        OBJUP_ERROR << absl::StrFormat(
            "Invalid part task %d [%d, %d) for %s", task.partNumber, task.byteRange.start,
            task.byteRange.end, ref.key);
        return OBJUP_ERR_INVALID_PARAM;
    }

    // The body is read once and reused by every attempt
    std::vector<char> body(len);
    objup_status_t status = source.read(task.byteRange.start, len, body.data());
    if (status != OBJUP_SUCCESS) {
        OBJUP_ERROR << absl::StrFormat("Failed to read part %d of %s at offset %d: %s",
                                       task.partNumber,
                                       ref.key,
                                       task.byteRange.start,
                                       objupEnumStrings::statusStr(status));
        return status;
    }

    const std::string what = absl::StrFormat("Upload of part %d of %s", task.partNumber, ref.key);
    std::string etag;
    status = objupRunWithRetry(policy, task.attempt, sleep_, stop, what, [&]() {
        etag.clear();
        return store_->uploadPart(ref, task.partNumber, std::string_view(body.data(), len), etag);
    });
    if (status != OBJUP_SUCCESS) {
        if (status == OBJUP_ERR_REMOTE_PERMANENT) {
            OBJUP_ERROR << what << " failed permanently";
        }
        return status;
    }

    result.partNumber = task.partNumber;
    result.eTag = std::move(etag);
    result.sizeUploaded = len;
    OBJUP_TRACE << absl::StrFormat("Uploaded part %d of %s, %d bytes, etag %s, %d attempt(s)",
                                   result.partNumber,
                                   ref.key,
                                   len,
                                   result.eTag,
                                   task.attempt);
    return OBJUP_SUCCESS;
}

objup_status_t
objupPartUploader::putObject(const std::string &key,
                             const objupObjectAttributes &attributes,
                             const objupDataSource &source,
                             const objupBackoffPolicy &policy,
                             std::string &etag,
                             const objupStopFn &stop) const {
    const uint64_t len = source.size();
    std::vector<char> body(len);
    if (len > 0) {
        const objup_status_t status = source.read(0, len, body.data());
        if (status != OBJUP_SUCCESS) {
            OBJUP_ERROR << "Failed to read " << len << " bytes for single put of " << key;
            return status;
        }
    }

    uint32_t attempt = 0;
    const std::string what = "Single put of " + key;
    return objupRunWithRetry(policy, attempt, sleep_, stop, what, [&]() {
        etag.clear();
        return store_->putObject(key, attributes, std::string_view(body.data(), len), etag);
    });
}
