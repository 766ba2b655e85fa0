/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "upload_session.h"

#include <stdexcept>
#include <vector>

#include <asio/post.hpp>
#include <absl/strings/str_format.h>

#include "common/objup_log.h"
#include "part_planner.h"
#include "store/object_store.h"

namespace {

// complete and abort are not chunked, one retry is all they get
objupBackoffPolicy
singleRetry(const objupBackoffPolicy &policy) {
    objupBackoffPolicy once = policy;
    once.maxAttempts = 2;
    return once;
}

} // namespace

objupUploadSession::objupUploadSession(std::string key,
                                       const objupUploadPlan &plan,
                                       std::shared_ptr<const objupPartUploader> uploader,
                                       const objupBackoffPolicy &policy)
    : key_(std::move(key)),
      plan_(plan),
      uploader_(std::move(uploader)),
      policy_(policy) {
    if (!uploader_) {
        throw std::invalid_argument("upload session needs a part uploader");
    }
    if (key_.empty()) {
        throw std::invalid_argument("upload session needs an object key");
    }
    if (plan_.partCount == 0) {
        throw std::invalid_argument("upload session needs a plan with at least one part");
    }
}

void
objupUploadSession::setState(objup_session_state_t state) {
    OBJUP_DEBUG << absl::StrFormat("Session %s [%s]: %s -> %s",
                                   key_,
                                   uploadId_,
                                   objupEnumStrings::sessionStateStr(state_),
                                   objupEnumStrings::sessionStateStr(state));
    state_ = state;
}

void
objupUploadSession::waitIdle(std::unique_lock<std::mutex> &lock) {
    idle_.wait(lock, [this] { return inFlight_ == 0; });
}

objup_status_t
objupUploadSession::initiate(const objupObjectAttributes &attributes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != objupSessionState::INITIATING || !uploadId_.empty()) {
            return OBJUP_ERR_NOT_ALLOWED;
        }
    }

    uint32_t attempt = 0;
    std::string upload_id;
    const objup_status_t status = objupRunWithRetry(
        policy_,
        attempt,
        uploader_->sleeper(),
        [this] { return cancel_.load(); },
        "Initiate of " + key_,
        [&]() {
            upload_id.clear();
            return uploader_->store().initiateMultipartUpload(key_, attributes, upload_id);
        });

    std::lock_guard<std::mutex> lock(mutex_);
    if (status == OBJUP_ERR_CANCELED) {
        setState(objupSessionState::ABORTED);
        status_ = OBJUP_ERR_CANCELED;
        return status_;
    }

    if (status != OBJUP_SUCCESS || upload_id.empty()) {
        OBJUP_ERROR << absl::StrFormat("Failed to initiate multipart upload of %s: %s",
                                       key_,
                                       objupEnumStrings::statusStr(status));
        setState(objupSessionState::FAILED);
        status_ = OBJUP_ERR_INITIATION_FAILED;
        return status_;
    }

    uploadId_ = std::move(upload_id);
    setState(objupSessionState::IN_PROGRESS);
    OBJUP_INFO << absl::StrFormat("Initiated upload %s of %s: %d parts of %d bytes",
                                  uploadId_,
                                  key_,
                                  plan_.partCount,
                                  plan_.partSize);
    return OBJUP_SUCCESS;
}

objup_status_t
objupUploadSession::resume(const std::string &upload_id) {
    if (upload_id.empty()) {
        return OBJUP_ERR_INVALID_PARAM;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != objupSessionState::INITIATING || !uploadId_.empty()) {
            return OBJUP_ERR_NOT_ALLOWED;
        }
    }

    const objupSessionRef ref{key_, upload_id};
    std::vector<objupRemotePart> stored;
    uint32_t attempt = 0;
    const objup_status_t status = objupRunWithRetry(
        policy_,
        attempt,
        uploader_->sleeper(),
        [this] { return cancel_.load(); },
        "Listing parts of " + key_,
        [&]() {
            stored.clear();
            return uploader_->store().listParts(ref, stored);
        });

    std::lock_guard<std::mutex> lock(mutex_);
    if (status == OBJUP_ERR_CANCELED) {
        setState(objupSessionState::ABORTED);
        status_ = OBJUP_ERR_CANCELED;
        return status_;
    }
    if (status != OBJUP_SUCCESS) {
        OBJUP_ERROR << absl::StrFormat("Cannot resume upload %s of %s: %s",
                                       upload_id,
                                       key_,
                                       objupEnumStrings::statusStr(status));
        setState(objupSessionState::FAILED);
        status_ = OBJUP_ERR_INITIATION_FAILED;
        return status_;
    }

    uploadId_ = upload_id;
    setState(objupSessionState::IN_PROGRESS);

    uint32_t adopted = 0;
    for (const auto &part : stored) {
        if (part.eTag.empty()) {
            continue;
        }
        if (recordLocked({part.partNumber, part.eTag, part.size}) == OBJUP_SUCCESS) {
            ++adopted;
        } else {
            OBJUP_DEBUG << absl::StrFormat(
                "Stored part %d of %s does not match the plan, uploading it again",
                part.partNumber,
                key_);
        }
    }
    OBJUP_INFO << absl::StrFormat("Resumed upload %s of %s with %d of %d parts already stored",
                                  uploadId_,
                                  key_,
                                  adopted,
                                  plan_.partCount);
    return OBJUP_SUCCESS;
}

bool
objupUploadSession::acquireSlot(objupPartSemaphore &slots) const {
    while (!stopRequested()) {
        if (slots.tryAcquireFor(kDispatchQuantum)) {
            return true;
        }
    }
    return false;
}

objup_status_t
objupUploadSession::submitParts(const objupDataSource &source,
                                asio::thread_pool &pool,
                                objupPartSemaphore &slots) {
    objupSessionRef ref;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != objupSessionState::IN_PROGRESS) {
            return OBJUP_ERR_NOT_ALLOWED;
        }
        ref = {key_, uploadId_};
    }

    if (source.size() != plan_.totalSize) {
        OBJUP_ERROR << absl::StrFormat("Source of %s holds %d bytes, plan expects %d",
                                       key_,
                                       source.size(),
                                       plan_.totalSize);
        return OBJUP_ERR_MISMATCH;
    }

    for (const auto &task : objupPartPlanner::makeTasks(plan_)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (completedParts_.count(task.partNumber)) {
                continue;
            }
        }

        if (!acquireSlot(slots)) {
            break;
        }
        // Stop may have been requested while the slot was handed over
        if (stopRequested()) {
            slots.release();
            break;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++inFlight_;
        }

        OBJUP_TRACE << absl::StrFormat("Dispatching part %d of %s", task.partNumber, key_);
        // A failed sibling only stops dispatching, parts in flight keep their retries
        asio::post(pool, [this, ref, task, &source, &slots]() mutable {
            objupPartResult result;
            objup_status_t status;
            try {
                status = uploader_->uploadPart(
                    ref, task, source, policy_, result, [this] { return cancel_.load(); });
            }
            catch (const std::exception &e) {
                OBJUP_ERROR << absl::StrFormat(
                    "Part %d of %s threw: %s", task.partNumber, key_, e.what());
                status = OBJUP_ERR_DATA_SOURCE;
            }
            onPartDone(task, status, result, slots);
        });
    }

    std::unique_lock<std::mutex> lock(mutex_);
    waitIdle(lock);

    if (cancel_.load()) {
        return OBJUP_ERR_CANCELED;
    }
    if (partFailure_ != OBJUP_SUCCESS) {
        return partFailure_;
    }
    if (completedParts_.size() != plan_.partCount) {
        return OBJUP_ERR_INCOMPLETE_PART_SET;
    }
    return OBJUP_SUCCESS;
}

void
objupUploadSession::onPartDone(const objupPartTask &task,
                               objup_status_t status,
                               const objupPartResult &result,
                               objupPartSemaphore &slots) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status == OBJUP_SUCCESS) {
            if (cancel_.load()) {
                OBJUP_TRACE << absl::StrFormat(
                    "Discarding part %d of %s, upload canceled", task.partNumber, key_);
            } else {
                status = recordLocked(result);
            }
        }

        if (status != OBJUP_SUCCESS && status != OBJUP_ERR_CANCELED &&
            partFailure_ == OBJUP_SUCCESS) {
            OBJUP_ERROR << absl::StrFormat("Part %d of %s failed after %d attempt(s): %s",
                                           task.partNumber,
                                           key_,
                                           task.attempt,
                                           objupEnumStrings::statusStr(status));
            partFailure_ = status;
            abortRequested_ = true;
        }
    }

    // The failure is visible before the slot can be reused by the dispatch loop
    slots.release();

    std::lock_guard<std::mutex> lock(mutex_);
    if (--inFlight_ == 0) {
        idle_.notify_all();
    }
}

objup_status_t
objupUploadSession::uploadSingle(const objupObjectAttributes &attributes,
                                 const objupDataSource &source,
                                 objupPartSemaphore &slots) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != objupSessionState::INITIATING || plan_.partCount != 1) {
            return OBJUP_ERR_NOT_ALLOWED;
        }
    }

    if (!acquireSlot(slots)) {
        std::lock_guard<std::mutex> lock(mutex_);
        setState(objupSessionState::ABORTED);
        status_ = OBJUP_ERR_CANCELED;
        return status_;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        setState(objupSessionState::IN_PROGRESS);
        ++inFlight_;
    }

    std::string etag;
    objup_status_t status;
    try {
        status = uploader_->putObject(
            key_, attributes, source, policy_, etag, [this] { return cancel_.load(); });
    }
    catch (const std::exception &e) {
        OBJUP_ERROR << "Single put of " << key_ << " threw: " << e.what();
        status = OBJUP_ERR_DATA_SOURCE;
    }
    slots.release();

    std::lock_guard<std::mutex> lock(mutex_);
    if (--inFlight_ == 0) {
        idle_.notify_all();
    }

    if (status == OBJUP_SUCCESS) {
        // Nothing to abort once a single put landed, the object exists
        completedParts_[1] = {1, etag, plan_.totalSize};
        bytesCompleted_ = plan_.totalSize;
        objectVersion_ = etag;
        setState(objupSessionState::COMPLETED);
        status_ = OBJUP_SUCCESS;
        OBJUP_INFO << absl::StrFormat("Stored %s with a single put, %d bytes", key_, plan_.totalSize);
    } else if (status == OBJUP_ERR_CANCELED) {
        setState(objupSessionState::ABORTED);
        status_ = status;
    } else {
        OBJUP_ERROR << absl::StrFormat(
            "Single put of %s failed: %s", key_, objupEnumStrings::statusStr(status));
        setState(objupSessionState::FAILED);
        status_ = status;
    }
    return status_;
}

objup_status_t
objupUploadSession::recordLocked(const objupPartResult &result) {
    if (result.partNumber == 0 || result.partNumber > plan_.partCount) {
        return OBJUP_ERR_INVALID_PARAM;
    }
    if (result.sizeUploaded != objupPartPlanner::partRange(plan_, result.partNumber).length()) {
        return OBJUP_ERR_MISMATCH;
    }

    auto it = completedParts_.find(result.partNumber);
    if (it != completedParts_.end()) {
        bytesCompleted_ -= it->second.sizeUploaded;
        it->second = result;
    } else {
        completedParts_.emplace(result.partNumber, result);
    }
    bytesCompleted_ += result.sizeUploaded;
    return OBJUP_SUCCESS;
}

objup_status_t
objupUploadSession::recordPart(const objupPartResult &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != objupSessionState::IN_PROGRESS) {
        return OBJUP_ERR_NOT_ALLOWED;
    }
    return recordLocked(result);
}

objup_status_t
objupUploadSession::complete(std::string &object_version) {
    objupSessionRef ref;
    std::vector<objupPartResult> parts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool after_partial =
            state_ == objupSessionState::FAILED && status_ == OBJUP_ERR_PARTIAL_UPLOAD;
        if ((state_ != objupSessionState::IN_PROGRESS && !after_partial) || inFlight_ > 0) {
            return OBJUP_ERR_NOT_ALLOWED;
        }
        if (completedParts_.size() != plan_.partCount) {
            OBJUP_ERROR << absl::StrFormat("Cannot complete %s: %d of %d parts uploaded",
                                           key_,
                                           completedParts_.size(),
                                           plan_.partCount);
            return OBJUP_ERR_INCOMPLETE_PART_SET;
        }

        // std::map iterates in ascending part number order
        parts.reserve(completedParts_.size());
        for (const auto &entry : completedParts_) {
            parts.push_back(entry.second);
        }
        ref = {key_, uploadId_};
        setState(objupSessionState::COMPLETING);
    }

    uint32_t attempt = 0;
    std::string version;
    const objup_status_t status = objupRunWithRetry(
        singleRetry(policy_), attempt, uploader_->sleeper(), {}, "Complete of " + key_, [&]() {
            version.clear();
            return uploader_->store().completeMultipartUpload(ref, parts, version);
        });

    std::lock_guard<std::mutex> lock(mutex_);
    if (status != OBJUP_SUCCESS) {
        OBJUP_WARN << absl::StrFormat(
            "PartialUploadIncomplete: complete of upload %s for %s failed (%s), %d parts "
            "remain stored until completed or aborted",
            uploadId_,
            key_,
            objupEnumStrings::statusStr(status),
            parts.size());
        setState(objupSessionState::FAILED);
        status_ = OBJUP_ERR_PARTIAL_UPLOAD;
        return status_;
    }

    objectVersion_ = version;
    object_version = version;
    setState(objupSessionState::COMPLETED);
    status_ = OBJUP_SUCCESS;
    OBJUP_INFO << absl::StrFormat("Completed upload %s of %s, %d parts, %d bytes",
                                  uploadId_,
                                  key_,
                                  parts.size(),
                                  plan_.totalSize);
    return OBJUP_SUCCESS;
}

bool
objupUploadSession::abortRemote() {
    objupSessionRef ref;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ref = {key_, uploadId_};
    }
    if (ref.uploadId.empty()) {
        return true;
    }

    uint32_t attempt = 0;
    const objup_status_t status = objupRunWithRetry(
        singleRetry(policy_), attempt, uploader_->sleeper(), {}, "Abort of " + key_, [&]() {
            return uploader_->store().abortMultipartUpload(ref);
        });

    if (status != OBJUP_SUCCESS) {
        OBJUP_WARN << absl::StrFormat(
            "AbortIncomplete: abort of upload %s for %s failed (%s), stored parts need a "
            "cleanup sweep",
            ref.uploadId,
            ref.key,
            objupEnumStrings::statusStr(status));
        std::lock_guard<std::mutex> lock(mutex_);
        remoteAbortFailed_ = true;
        return false;
    }

    OBJUP_INFO << absl::StrFormat("Aborted upload %s of %s", ref.uploadId, ref.key);
    return true;
}

objup_status_t
objupUploadSession::abort() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        abortRequested_ = true;
        waitIdle(lock);
        if (state_ == objupSessionState::COMPLETED || state_ == objupSessionState::ABORTED ||
            state_ == objupSessionState::ABORTING || state_ == objupSessionState::COMPLETING) {
            return OBJUP_ERR_NOT_ALLOWED;
        }
        setState(objupSessionState::ABORTING);
    }

    const bool aborted = abortRemote();

    std::lock_guard<std::mutex> lock(mutex_);
    setState(objupSessionState::ABORTED);
    status_ = aborted ? OBJUP_ERR_CANCELED : OBJUP_ERR_ABORT_INCOMPLETE;
    return aborted ? OBJUP_SUCCESS : OBJUP_ERR_ABORT_INCOMPLETE;
}

objup_status_t
objupUploadSession::abortAfterFailure(objup_status_t cause) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        abortRequested_ = true;
        waitIdle(lock);
        if (state_ == objupSessionState::COMPLETED || state_ == objupSessionState::ABORTED ||
            state_ == objupSessionState::ABORTING || state_ == objupSessionState::COMPLETING) {
            return OBJUP_ERR_NOT_ALLOWED;
        }
        setState(objupSessionState::ABORTING);
    }

    abortRemote();

    std::lock_guard<std::mutex> lock(mutex_);
    setState(objupSessionState::FAILED);
    status_ = cause;
    return cause;
}

void
objupUploadSession::requestCancel() {
    if (!cancel_.exchange(true)) {
        OBJUP_INFO << "Cancel requested for upload of " << key_;
    }
}

objupProgress
objupUploadSession::getProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    objupProgress progress;
    progress.bytesCompleted = bytesCompleted_;
    progress.bytesTotal = plan_.totalSize;
    progress.partsCompleted = static_cast<uint32_t>(completedParts_.size());
    progress.partsTotal = plan_.partCount;
    progress.state = state_;
    return progress;
}

objup_session_state_t
objupUploadSession::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

objupSessionRef
objupUploadSession::getRef() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {key_, uploadId_};
}

void
objupUploadSession::getOutcome(objupUploadOutcome &outcome) const {
    std::lock_guard<std::mutex> lock(mutex_);
    outcome.status = status_;
    outcome.state = state_;
    outcome.key = key_;
    outcome.uploadId = uploadId_;
    outcome.objectVersion = objectVersion_;
    outcome.partsCompleted = static_cast<uint32_t>(completedParts_.size());
    outcome.partsTotal = plan_.partCount;
    outcome.bytesCompleted = bytesCompleted_;
    outcome.remoteAbortFailed = remoteAbortFailed_;
    outcome.message = absl::StrFormat("%s: %s, %d of %d parts stored%s",
                                      key_,
                                      objupEnumStrings::statusStr(status_),
                                      outcome.partsCompleted,
                                      outcome.partsTotal,
                                      uploadId_.empty() ? "" : " under upload " + uploadId_);
}
