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
#include <stdexcept>
#include <vector>

#include <absl/strings/str_format.h>

#include "objup.h"
#include "common/objup_log.h"
#include "common/str_tools.h"
#include "coordinator_data.h"
#include "part_planner.h"

/*** objupCoordinatorData ***/

objupCoordinatorData::objupCoordinatorData(std::shared_ptr<iObjectStore> store,
                                           const objupConfig &cfg)
    : config(cfg),
      policy(objupBackoffPolicy::fromConfig(cfg)),
      pool(cfg.effectiveWorkerThreads()),
      slots(cfg.maxConcurrentParts),
      uploader(std::make_shared<const objupPartUploader>(std::move(store))) {}

objupCoordinatorData::~objupCoordinatorData() {
    std::unordered_map<objup_handle_t, objupUploadRecord> pending;
    {
        std::lock_guard<std::mutex> guard(lock);
        pending.swap(records);
    }

    for (auto &entry : pending) {
        entry.second.session->requestCancel();
    }
    for (auto &entry : pending) {
        if (entry.second.driver.joinable()) {
            entry.second.driver.join();
        }
    }

    pool.join();
}

std::shared_ptr<objupUploadSession>
objupCoordinatorData::findSession(objup_handle_t handle) const {
    std::lock_guard<std::mutex> guard(lock);
    auto it = records.find(handle);
    if (it == records.end()) {
        return nullptr;
    }
    return it->second.session;
}

void
objupCoordinatorData::reapFinished() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> guard(lock);
        for (auto &entry : records) {
            objupUploadRecord &record = entry.second;
            if (record.driver.joinable() && objupIsTerminal(record.session->getState())) {
                finished.push_back(std::move(record.driver));
                record.source.reset();
            }
        }
    }

    // A final session's driver has at most its closing log line left
    for (auto &driver : finished) {
        driver.join();
    }
    if (!finished.empty()) {
        OBJUP_TRACE << absl::StrFormat("Reaped %d finished upload driver(s)", finished.size());
    }
}

void
objupCoordinatorData::drive(const std::shared_ptr<objupUploadSession> &session,
                            const std::shared_ptr<const objupDataSource> &source,
                            const objupObjectAttributes &attributes,
                            const std::string &resume_upload_id,
                            bool single_put) {
    objup_status_t status;
    try {
        if (single_put) {
            status = session->uploadSingle(attributes, *source, slots);
        } else {
            status = resume_upload_id.empty() ? session->initiate(attributes) :
                                                session->resume(resume_upload_id);
            if (status == OBJUP_SUCCESS) {
                status = session->submitParts(*source, pool, slots);
                if (status == OBJUP_SUCCESS) {
                    std::string version;
                    status = session->complete(version);
                } else if (status == OBJUP_ERR_CANCELED) {
                    status = session->abort();
                } else {
                    status = session->abortAfterFailure(status);
                }
            }
        }
    }
    catch (const std::exception &e) {
        OBJUP_ERROR << "Upload of " << session->getRef().key << " stopped: " << e.what();
        status = session->abortAfterFailure(OBJUP_ERR_DATA_SOURCE);
    }

    OBJUP_DEBUG << absl::StrFormat("Upload of %s finished in state %s: %s",
                                   session->getRef().key,
                                   objupEnumStrings::sessionStateStr(session->getState()),
                                   objupEnumStrings::statusStr(status));
}

/*** objupTransferCoordinator ***/

namespace {

objupConfig
validated(const objupConfig &cfg) {
    std::string reason;
    if (cfg.validate(reason) != OBJUP_SUCCESS) {
        throw std::invalid_argument("invalid objup configuration: " + reason);
    }
    return cfg;
}

} // namespace

objupTransferCoordinator::objupTransferCoordinator(std::shared_ptr<iObjectStore> store,
                                                   const objupConfig &cfg) {
    if (!store) {
        throw std::invalid_argument("transfer coordinator needs an object store");
    }
    data = std::make_unique<objupCoordinatorData>(std::move(store), validated(cfg));
    OBJUP_DEBUG << absl::StrFormat("Transfer coordinator started: %d parts in flight, %d workers",
                                   cfg.maxConcurrentParts,
                                   cfg.effectiveWorkerThreads());
}

objupTransferCoordinator::~objupTransferCoordinator() = default;

objup_status_t
objupTransferCoordinator::submit(const objupUploadRequest &request, objup_handle_t &handle) {
    const std::string key = objup::sanitizeObjectKey(request.key);
    if (!objup::isValidObjectKey(key)) {
        OBJUP_ERROR << "Invalid object key '" << request.key << "'";
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (!request.source) {
        OBJUP_ERROR << "No data source for " << key;
        return OBJUP_ERR_INVALID_PARAM;
    }

    const objupConfig &cfg = data->config;
    const uint64_t total = request.source->size();
    if (request.sizeHint != 0 && request.sizeHint != total) {
        OBJUP_ERROR << absl::StrFormat(
            "Size hint %d of %s does not match the source size %d", request.sizeHint, key, total);
        return OBJUP_ERR_MISMATCH;
    }

    const uint64_t part_size = request.options.partSize ? request.options.partSize : cfg.partSize;
    objupUploadPlan plan;
    bool single_put = false;
    objup_status_t status = total == 0 ?
        OBJUP_ERR_SIZE_TOO_SMALL :
        objupPartPlanner::plan(
            total, part_size, cfg.minPartSize, cfg.maxPartCount, cfg.partAlignment, plan);
    if (status == OBJUP_ERR_SIZE_TOO_SMALL) {
        if (!request.resumeUploadId.empty()) {
            OBJUP_ERROR << "Cannot resume " << key << ", it is too small for a multipart upload";
            return OBJUP_ERR_INVALID_PARAM;
        }
        if (total > cfg.maxSinglePartUploadSize) {
            return OBJUP_ERR_SIZE_TOO_SMALL;
        }
        single_put = true;
        plan = {total, total, 1};
    } else if (status != OBJUP_SUCCESS) {
        OBJUP_ERROR << absl::StrFormat(
            "Cannot plan upload of %s (%d bytes): %s", key, total, objupEnumStrings::statusStr(status));
        return status;
    }

    objupObjectAttributes attributes;
    attributes.contentType = request.options.contentType;
    if (attributes.contentType.empty()) {
        const auto *file = dynamic_cast<const objupFileSource *>(request.source.get());
        attributes.contentType = objup::contentTypeFor(file ? file->path() : key);
        OBJUP_DEBUG << "Content type of " << key << " defaults to " << attributes.contentType;
    }
    attributes.cacheControl = request.options.cacheControl;
    attributes.metadata = objup::normalizeMetadata(request.options.metadata);

    auto session = std::make_shared<objupUploadSession>(key, plan, data->uploader, data->policy);

    data->reapFinished();

    handle = data->nextHandle++;
    std::lock_guard<std::mutex> guard(data->lock);
    objupUploadRecord &record = data->records[handle];
    record.session = session;
    record.source = request.source;
    record.driver = std::thread(&objupCoordinatorData::drive,
                                data.get(),
                                session,
                                request.source,
                                attributes,
                                request.resumeUploadId,
                                single_put);

    OBJUP_DEBUG << absl::StrFormat("Upload %d of %s: %d bytes, %d part(s)%s",
                                   handle,
                                   key,
                                   total,
                                   plan.partCount,
                                   single_put ? ", single put" : "");
    return OBJUP_SUCCESS;
}

objup_status_t
objupTransferCoordinator::startUpload(const std::string &key,
                                      std::shared_ptr<const objupDataSource> source,
                                      uint64_t size_hint,
                                      const objupUploadOptions &options,
                                      objup_handle_t &handle) {
    objupUploadRequest request;
    request.key = key;
    request.source = std::move(source);
    request.sizeHint = size_hint;
    request.options = options;
    return submit(request, handle);
}

objup_status_t
objupTransferCoordinator::progress(objup_handle_t handle, objupProgress &progress) const {
    auto session = data->findSession(handle);
    if (!session) {
        return OBJUP_ERR_NOT_FOUND;
    }
    progress = session->getProgress();
    return OBJUP_SUCCESS;
}

objup_status_t
objupTransferCoordinator::cancel(objup_handle_t handle) {
    auto session = data->findSession(handle);
    if (!session) {
        return OBJUP_ERR_NOT_FOUND;
    }
    session->requestCancel();
    return OBJUP_SUCCESS;
}

objup_status_t
objupTransferCoordinator::await(objup_handle_t handle, objupUploadOutcome &outcome) {
    objupUploadRecord record;
    {
        std::lock_guard<std::mutex> guard(data->lock);
        auto it = data->records.find(handle);
        if (it == data->records.end()) {
            return OBJUP_ERR_NOT_FOUND;
        }
        record = std::move(it->second);
        data->records.erase(it);
    }

    if (record.driver.joinable()) {
        record.driver.join();
    }
    record.session->getOutcome(outcome);
    return outcome.status;
}

size_t
objupTransferCoordinator::activeCount() const {
    std::lock_guard<std::mutex> guard(data->lock);
    size_t active = 0;
    for (const auto &entry : data->records) {
        if (!objupIsTerminal(entry.second.session->getState())) {
            ++active;
        }
    }
    return active;
}

uint32_t
objupTransferCoordinator::peakPartsInFlight() const {
    return data->slots.peakInUse();
}

const objupConfig &
objupTransferCoordinator::getConfig() const {
    return data->config;
}
