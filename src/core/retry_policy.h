/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef OBJUP_CORE_RETRY_POLICY_H
#define OBJUP_CORE_RETRY_POLICY_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

#include "objup_types.h"
#include "objup_params.h"
#include "common/objup_log.h"

#include <absl/strings/str_format.h>

using objupSleepFn = std::function<void(std::chrono::milliseconds)>;
using objupStopFn = std::function<bool()>;

/**
 * Exponential backoff with jitter. Immutable once built and passed by value into every
 * retrying call; the attempt counter lives with the caller (the part task), never here.
 */
struct objupBackoffPolicy {
    std::chrono::milliseconds baseDelay = objupConfig::kDefaultRetryBaseDelay;
    double factor = 2.0;
    std::chrono::milliseconds maxDelay = objupConfig::kDefaultRetryMaxDelay;
    uint32_t maxAttempts = objupConfig::kDefaultMaxRetryAttempts;
    /** Up to this fraction of the delay is added at random */
    double jitterRatio = 0.1;

    [[nodiscard]] static objupBackoffPolicy
    fromConfig(const objupConfig &cfg);

    /**
     * Delay before retry number `retry` (0 for the first retry).
     * @param jitter_sample Uniform sample in [0, 1)
     */
    [[nodiscard]] std::chrono::milliseconds
    delayFor(uint32_t retry, double jitter_sample) const noexcept;

    /** Same as delayFor with a sample drawn from a thread local generator */
    [[nodiscard]] std::chrono::milliseconds
    jitteredDelayFor(uint32_t retry) const;
};

/**
 * Map a failed remote call to OBJUP_ERR_REMOTE_TRANSIENT or OBJUP_ERR_REMOTE_PERMANENT.
 *
 * @param http_code     HTTP status of the response, <= 0 when no response was received
 * @param error_code    Error code from the response body (SlowDown, AccessDenied, ...)
 * @param network_error The request failed below HTTP (connect, reset, deadline)
 */
[[nodiscard]] objup_status_t
objupClassifyRemoteError(int http_code, std::string_view error_code, bool network_error) noexcept;

void
objupDefaultSleep(std::chrono::milliseconds delay);

/**
 * Run `call` until it succeeds, fails with anything but OBJUP_ERR_REMOTE_TRANSIENT, or the
 * policy runs out of attempts. `attempt` is incremented for every call made. `stop` is
 * polled between attempts; when it returns true the loop ends with OBJUP_ERR_CANCELED.
 */
template<typename Call>
[[nodiscard]] objup_status_t
objupRunWithRetry(const objupBackoffPolicy &policy,
                  uint32_t &attempt,
                  const objupSleepFn &sleep,
                  const objupStopFn &stop,
                  std::string_view what,
                  Call &&call) {
    for (;;) {
        const objup_status_t status = call();
        ++attempt;

        if (status != OBJUP_ERR_REMOTE_TRANSIENT) {
            return status;
        }

        if (attempt >= policy.maxAttempts) {
            OBJUP_ERROR << absl::StrFormat(
                "%s failed after %d attempts, giving up", what, attempt);
            return status;
        }

        if (stop && stop()) {
            OBJUP_DEBUG << what << ": canceled while retrying";
            return OBJUP_ERR_CANCELED;
        }

        const auto delay = policy.jitteredDelayFor(attempt - 1);
        OBJUP_WARN << absl::StrFormat("%s failed transiently (attempt %d of %d), retrying in %d ms",
                                      what,
                                      attempt,
                                      policy.maxAttempts,
                                      delay.count());
        if (sleep) {
            sleep(delay);
        } else {
            objupDefaultSleep(delay);
        }
    }
}

#endif // OBJUP_CORE_RETRY_POLICY_H
