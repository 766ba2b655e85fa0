/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "objup_sweep.h"

#include <absl/strings/str_format.h>

#include "common/objup_log.h"

objup_status_t
objupSweepIncompleteUploads(iObjectStore &store,
                            const std::string &prefix,
                            std::chrono::milliseconds older_than,
                            objupSweepReport &report,
                            int64_t now_ms) {
    if (older_than.count() < 0) {
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (now_ms < 0) {
        now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
    }
    const int64_t cutoff = now_ms - older_than.count();

    std::vector<objupRemoteUpload> uploads;
    objup_status_t status = store.listMultipartUploads(prefix, uploads);
    if (status != OBJUP_SUCCESS) {
        OBJUP_ERROR << absl::StrFormat("Cannot list multipart uploads under '%s': %s",
                                       prefix,
                                       objupEnumStrings::statusStr(status));
        return status;
    }

    for (const auto &upload : uploads) {
        if (upload.initiatedMs > cutoff) {
            ++report.skipped;
            continue;
        }

        const objupSessionRef ref{upload.key, upload.uploadId};

        // The part listing only feeds the report, a failure does not stop the abort
        std::vector<objupRemotePart> parts;
        if (store.listParts(ref, parts) != OBJUP_SUCCESS) {
            parts.clear();
        }

        status = store.abortMultipartUpload(ref);
        if (status != OBJUP_SUCCESS) {
            OBJUP_WARN << absl::StrFormat("Sweep could not abort upload %s of %s: %s",
                                          upload.uploadId,
                                          upload.key,
                                          objupEnumStrings::statusStr(status));
            report.failed.push_back(upload);
            continue;
        }
        OBJUP_DEBUG << "Sweep aborted upload " << upload.uploadId << " of " << upload.key;
        report.aborted.push_back(upload);
        report.partsDropped += parts.size();
        for (const auto &part : parts) {
            report.bytesDropped += part.size;
        }
    }

    OBJUP_INFO << absl::StrFormat("Sweep under '%s': %d aborted, %d failed, %d skipped",
                                  prefix,
                                  report.aborted.size(),
                                  report.failed.size(),
                                  report.skipped);
    return report.failed.empty() ? OBJUP_SUCCESS : OBJUP_ERR_ABORT_INCOMPLETE;
}
