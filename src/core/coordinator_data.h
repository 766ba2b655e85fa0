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
#ifndef OBJUP_CORE_COORDINATOR_DATA_H
#define OBJUP_CORE_COORDINATOR_DATA_H

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include <asio/thread_pool.hpp>

#include "objup.h"
#include "part_semaphore.h"
#include "part_uploader.h"
#include "upload_session.h"

/**
 * One submitted upload. The driver thread owns the flow of the session, the record keeps
 * the source alive until the session is final. The session stays for await.
 */
struct objupUploadRecord {
    std::shared_ptr<objupUploadSession> session;
    std::shared_ptr<const objupDataSource> source;
    std::thread driver;
};

class objupCoordinatorData {
    public:
        objupCoordinatorData(std::shared_ptr<iObjectStore> store, const objupConfig &cfg);
        ~objupCoordinatorData();

        /** Body of a driver thread, runs the session to a final state */
        void
        drive(const std::shared_ptr<objupUploadSession> &session,
              const std::shared_ptr<const objupDataSource> &source,
              const objupObjectAttributes &attributes,
              const std::string &resume_upload_id,
              bool single_put);

        [[nodiscard]] std::shared_ptr<objupUploadSession>
        findSession(objup_handle_t handle) const;

        /** Join the drivers of final sessions and drop their sources, records stay */
        void
        reapFinished();

        const objupConfig config;
        const objupBackoffPolicy policy;

        // Outlives the records: drivers are joined before the pool stops
        asio::thread_pool pool;
        objupPartSemaphore slots;
        std::shared_ptr<const objupPartUploader> uploader;

        mutable std::mutex lock;
        std::unordered_map<objup_handle_t, objupUploadRecord> records;
        std::atomic<objup_handle_t> nextHandle{OBJUP_INVALID_HANDLE + 1};
};

#endif // OBJUP_CORE_COORDINATOR_DATA_H
