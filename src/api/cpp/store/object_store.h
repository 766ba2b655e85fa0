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
#ifndef __OBJECT_STORE_H
#define __OBJECT_STORE_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "objup_types.h"

/**
 * @struct objupRemotePart
 * @brief  A part as the store reports it through ListParts
 */
struct objupRemotePart {
    uint32_t partNumber = 0;
    std::string eTag;
    uint64_t size = 0;
};

/**
 * @struct objupRemoteUpload
 * @brief  An in-progress multipart upload as reported by ListMultipartUploads
 */
struct objupRemoteUpload {
    std::string key;
    std::string uploadId;
    /** @var Initiation time in milliseconds since the epoch */
    int64_t initiatedMs = 0;
};

/**
 * @class iObjectStore
 * @brief Calls of an S3-compatible object store used by the upload engine.
 *
 * Every call is synchronous, carries its own deadline and returns OBJUP_SUCCESS,
 * OBJUP_ERR_REMOTE_TRANSIENT (network failure, timeout, 5xx, throttling) or
 * OBJUP_ERR_REMOTE_PERMANENT (auth, other 4xx). Retrying is the caller's business.
 * Implementations must be safe to call from several threads at once.
 */
class iObjectStore {
public:
    virtual ~iObjectStore() = default;

    /**
     * @brief  Start a multipart upload.
     * @param  key        Object key
     * @param  attributes Content type, cache control and user metadata
     * @param  upload_id  Filled with the id the store assigned
     */
    [[nodiscard]] virtual objup_status_t
    initiateMultipartUpload(const std::string &key,
                            const objupObjectAttributes &attributes,
                            std::string &upload_id) = 0;

    /**
     * @brief  Upload the body of one part. Uploading the same part number again replaces
     *         the earlier body.
     * @param  ref         Key and upload id of the session
     * @param  part_number 1-based part number
     * @param  body        Part bytes, not retained after the call
     * @param  etag        Filled with the entity tag of the stored part
     */
    [[nodiscard]] virtual objup_status_t
    uploadPart(const objupSessionRef &ref,
               uint32_t part_number,
               std::string_view body,
               std::string &etag) = 0;

    /**
     * @brief  Assemble the object from its parts.
     * @param  parts          Parts sorted by ascending part number
     * @param  object_version Filled with the version id, or the entity tag on unversioned buckets
     */
    [[nodiscard]] virtual objup_status_t
    completeMultipartUpload(const objupSessionRef &ref,
                            const std::vector<objupPartResult> &parts,
                            std::string &object_version) = 0;

    /**
     * @brief  Drop an upload and every part stored for it.
     */
    [[nodiscard]] virtual objup_status_t
    abortMultipartUpload(const objupSessionRef &ref) = 0;

    /**
     * @brief  Store a small object with one request.
     */
    [[nodiscard]] virtual objup_status_t
    putObject(const std::string &key,
              const objupObjectAttributes &attributes,
              std::string_view body,
              std::string &etag) = 0;

    /**
     * @brief  List the parts stored so far for an upload.
     */
    [[nodiscard]] virtual objup_status_t
    listParts(const objupSessionRef &ref, std::vector<objupRemotePart> &parts) = 0;

    /**
     * @brief  List the multipart uploads in progress under a key prefix.
     */
    [[nodiscard]] virtual objup_status_t
    listMultipartUploads(const std::string &prefix, std::vector<objupRemoteUpload> &uploads) = 0;
};

#endif
