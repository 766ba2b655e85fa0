/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef OBJUP_CORE_UPLOAD_SESSION_H
#define OBJUP_CORE_UPLOAD_SESSION_H

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <asio/thread_pool.hpp>

#include "objup_types.h"
#include "objup_data_source.h"
#include "part_semaphore.h"
#include "part_uploader.h"
#include "retry_policy.h"

/**
 * One multipart upload: initiate, dispatch parts, record results, complete or abort.
 *
 * completedParts is owned by the session and only touched under its mutex. Part uploads
 * run on the caller's pool and never hold that mutex across a remote call.
 */
class objupUploadSession {
public:
    /** Granularity at which the dispatch loop notices cancellation */
    static constexpr std::chrono::milliseconds kDispatchQuantum = std::chrono::milliseconds(10);

    objupUploadSession(std::string key,
                       const objupUploadPlan &plan,
                       std::shared_ptr<const objupPartUploader> uploader,
                       const objupBackoffPolicy &policy);

    objupUploadSession(const objupUploadSession &) = delete;
    objupUploadSession &
    operator=(const objupUploadSession &) = delete;

    /**
     * Start the remote upload and move to IN_PROGRESS.
     * @return OBJUP_SUCCESS, OBJUP_ERR_INITIATION_FAILED (session FAILED) or
     *         OBJUP_ERR_CANCELED when canceled during the retries (session ABORTED)
     */
    [[nodiscard]] objup_status_t
    initiate(const objupObjectAttributes &attributes);

    /**
     * Attach to an upload started earlier. Parts already stored with the planned size are
     * recorded as done, the others are uploaded again by submitParts().
     */
    [[nodiscard]] objup_status_t
    resume(const std::string &upload_id);

    /**
     * Upload every planned part that is not recorded yet. Each part waits for a slot of
     * the shared semaphore, runs on pool and is recorded when it returns. Dispatch stops
     * on cancellation or on the first part failure; parts in flight are awaited before
     * returning.
     *
     * @return OBJUP_SUCCESS when every part is recorded, OBJUP_ERR_CANCELED, or the error
     *         of the first failed part
     */
    [[nodiscard]] objup_status_t
    submitParts(const objupDataSource &source, asio::thread_pool &pool, objupPartSemaphore &slots);

    /**
     * Send a small object with one put instead of parts. The session must still be in
     * INITIATING and is planned as a single part.
     */
    [[nodiscard]] objup_status_t
    uploadSingle(const objupObjectAttributes &attributes,
                 const objupDataSource &source,
                 objupPartSemaphore &slots);

    /**
     * Record a part uploaded outside of submitParts(). Recording the same part number
     * again replaces the earlier result, as the store does.
     * @return OBJUP_ERR_INVALID_PARAM for a part number outside of the plan,
     *         OBJUP_ERR_MISMATCH when the size differs from the planned range,
     *         OBJUP_ERR_NOT_ALLOWED when the session is not IN_PROGRESS
     */
    [[nodiscard]] objup_status_t
    recordPart(const objupPartResult &result);

    /**
     * Assemble the object. Requires a result for every planned part, the part list is
     * sent sorted by part number. A failed complete call is retried once when the failure
     * is transient. Can be called again after it left the session FAILED with
     * OBJUP_ERR_PARTIAL_UPLOAD.
     */
    [[nodiscard]] objup_status_t
    complete(std::string &object_version);

    /**
     * Best effort remote abort. The session always ends ABORTED, the return value is
     * OBJUP_ERR_ABORT_INCOMPLETE when the remote call failed.
     */
    [[nodiscard]] objup_status_t
    abort();

    /**
     * Remote abort after cause made the upload impossible. The session ends FAILED with
     * cause as its status, whatever the abort call returned.
     */
    objup_status_t
    abortAfterFailure(objup_status_t cause);

    /** Stop dispatching new parts, results of parts in flight are discarded */
    void
    requestCancel();

    [[nodiscard]] bool
    isCancelRequested() const noexcept {
        return cancel_.load();
    }

    [[nodiscard]] objupProgress
    getProgress() const;

    [[nodiscard]] objup_session_state_t
    getState() const;

    [[nodiscard]] objupSessionRef
    getRef() const;

    [[nodiscard]] const objupUploadPlan &
    getPlan() const noexcept {
        return plan_;
    }

    /** Fill outcome with the current status, identity and counters */
    void
    getOutcome(objupUploadOutcome &outcome) const;

private:
    [[nodiscard]] bool
    stopRequested() const noexcept {
        return cancel_.load() || abortRequested_.load();
    }

    [[nodiscard]] bool
    acquireSlot(objupPartSemaphore &slots) const;

    void
    onPartDone(const objupPartTask &task,
               objup_status_t status,
               const objupPartResult &result,
               objupPartSemaphore &slots);

    objup_status_t
    recordLocked(const objupPartResult &result);

    /** Caller holds mutex_ */
    void
    setState(objup_session_state_t state);

    void
    waitIdle(std::unique_lock<std::mutex> &lock);

    /** Abort call with one retry on a transient failure. Sets remoteAbortFailed_. */
    bool
    abortRemote();

    const std::string key_;
    const objupUploadPlan plan_;
    const std::shared_ptr<const objupPartUploader> uploader_;
    const objupBackoffPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::string uploadId_;
    std::string objectVersion_;
    objup_session_state_t state_ = objupSessionState::INITIATING;
    objup_status_t status_ = OBJUP_IN_PROG;
    objup_status_t partFailure_ = OBJUP_SUCCESS;
    std::map<uint32_t, objupPartResult> completedParts_;
    uint64_t bytesCompleted_ = 0;
    uint32_t inFlight_ = 0;
    bool remoteAbortFailed_ = false;

    std::atomic<bool> cancel_{false};
    std::atomic<bool> abortRequested_{false};
};

#endif // OBJUP_CORE_UPLOAD_SESSION_H
