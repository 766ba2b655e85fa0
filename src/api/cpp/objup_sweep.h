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
#ifndef _OBJUP_SWEEP_H
#define _OBJUP_SWEEP_H

#include <chrono>
#include <string>
#include <vector>

#include "objup_types.h"
#include "store/object_store.h"

/**
 * @struct objupSweepReport
 * @brief  What a cleanup sweep found and did
 */
struct objupSweepReport {
    /** @var Uploads aborted by the sweep */
    std::vector<objupRemoteUpload> aborted;
    /** @var Stale uploads whose abort call failed */
    std::vector<objupRemoteUpload> failed;
    /** @var Uploads younger than the cutoff, left alone */
    uint32_t skipped = 0;
    /** @var Parts stored under the aborted uploads */
    uint64_t partsDropped = 0;
    /** @var Bytes stored under the aborted uploads */
    uint64_t bytesDropped = 0;
};

/**
 * @brief  Abort the multipart uploads under prefix that were initiated more than
 *         older_than ago, releasing the parts that failed or abandoned sessions left behind.
 * @param  store      Object store to sweep
 * @param  prefix     Key prefix, empty for the whole bucket
 * @param  older_than Minimum age of an upload to abort
 * @param  report     Filled with the aborted, failed and skipped uploads
 * @param  now_ms     Current time in milliseconds since the epoch, negative for the clock
 * @return OBJUP_SUCCESS, OBJUP_ERR_ABORT_INCOMPLETE when an abort failed, or the error
 *         of the listing call
 */
objup_status_t
objupSweepIncompleteUploads(iObjectStore &store,
                            const std::string &prefix,
                            std::chrono::milliseconds older_than,
                            objupSweepReport &report,
                            int64_t now_ms = -1);

#endif
