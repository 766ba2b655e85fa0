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
#ifndef OBJUP_TEST_GTEST_MOCKS_FAKE_OBJECT_STORE_H
#define OBJUP_TEST_GTEST_MOCKS_FAKE_OBJECT_STORE_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "store/object_store.h"

namespace gtest::mocks {

/**
 * In-memory S3-compatible store. Thread safe, validates the complete call like a real
 * store (ascending part numbers, matching entity tags) and can inject failures.
 */
class FakeObjectStore : public iObjectStore {
public:
    enum class Op { INITIATE, UPLOAD_PART, COMPLETE, ABORT, PUT, LIST_PARTS, LIST_UPLOADS };

    /** Called inside uploadPart before the part is stored, without the store lock held */
    using PartHook = std::function<void(const objupSessionRef &ref, uint32_t part_number)>;

    struct StoredObject {
        std::string data;
        std::string eTag;
        std::string version;
        objupObjectAttributes attributes;
    };

    objup_status_t
    initiateMultipartUpload(const std::string &key,
                            const objupObjectAttributes &attributes,
                            std::string &upload_id) override;

    objup_status_t
    uploadPart(const objupSessionRef &ref,
               uint32_t part_number,
               std::string_view body,
               std::string &etag) override;

    objup_status_t
    completeMultipartUpload(const objupSessionRef &ref,
                            const std::vector<objupPartResult> &parts,
                            std::string &object_version) override;

    objup_status_t
    abortMultipartUpload(const objupSessionRef &ref) override;

    objup_status_t
    putObject(const std::string &key,
              const objupObjectAttributes &attributes,
              std::string_view body,
              std::string &etag) override;

    objup_status_t
    listParts(const objupSessionRef &ref, std::vector<objupRemotePart> &parts) override;

    objup_status_t
    listMultipartUploads(const std::string &prefix,
                         std::vector<objupRemoteUpload> &uploads) override;

    /** Fail the next times calls of op with status */
    void
    failNext(Op op, objup_status_t status, uint32_t times = 1);

    /** Fail the next times uploads of part_number, of any upload, with status */
    void
    failPart(uint32_t part_number, objup_status_t status, uint32_t times = 1);

    void
    setPartHook(PartHook hook);

    /** Initiation time given to the uploads started from now on */
    void
    setNowMs(int64_t now_ms);

    bool
    getObject(const std::string &key, StoredObject &object) const;

    /** Part numbers of every complete call, in call order */
    std::vector<std::vector<uint32_t>>
    getCompleteCalls() const;

    /** Part numbers in the order their upload was stored */
    std::vector<uint32_t>
    getStoreOrder() const;

    /** Number of uploadPart calls for a part number, failed ones included */
    uint32_t
    getPartCalls(uint32_t part_number) const;

    uint32_t
    getCalls(Op op) const;

    size_t
    getPendingUploads() const;

private:
    struct PendingUpload {
        std::string key;
        objupObjectAttributes attributes;
        int64_t initiatedMs = 0;
        std::map<uint32_t, std::pair<std::string, std::string>> parts; // etag, data
    };

    [[nodiscard]] bool
    takeFailure(Op op, objup_status_t &status);

    mutable std::mutex mutex_;
    std::map<std::string, PendingUpload> uploads_;
    std::map<std::string, StoredObject> objects_;
    std::map<Op, std::pair<objup_status_t, uint32_t>> failures_;
    std::map<uint32_t, std::pair<objup_status_t, uint32_t>> partFailures_;
    std::map<Op, uint32_t> calls_;
    std::map<uint32_t, uint32_t> partCalls_;
    std::vector<std::vector<uint32_t>> completeCalls_;
    std::vector<uint32_t> storeOrder_;
    PartHook partHook_;
    int64_t nowMs_ = 0;
    uint64_t nextId_ = 1;
};

} // namespace gtest::mocks

#endif // OBJUP_TEST_GTEST_MOCKS_FAKE_OBJECT_STORE_H
