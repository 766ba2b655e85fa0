/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "retry_policy.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <random>
#include <thread>

#include <absl/strings/match.h>

namespace {

// Error codes S3-compatible stores send when they want the client to slow down or
// when the failure is on their side.
constexpr std::array<std::string_view, 9> transientCodes = {
    "SlowDown",
    "Throttling",
    "ThrottlingException",
    "ThrottledException",
    "RequestThrottled",
    "RequestLimitExceeded",
    "TooManyRequestsException",
    "ServiceUnavailable",
    "RequestTimeout",
};

constexpr std::array<std::string_view, 4> transientSuffixes = {
    "InternalError",
    "ServiceUnavailable",
    "SlowDown",
    "Throttling",
};

bool
isTransientCode(std::string_view code) {
    if (std::find(transientCodes.begin(), transientCodes.end(), code) != transientCodes.end()) {
        return true;
    }
    return std::any_of(transientSuffixes.begin(), transientSuffixes.end(), [&](auto suffix) {
        return absl::EndsWith(code, suffix);
    });
}

} // namespace

objupBackoffPolicy
objupBackoffPolicy::fromConfig(const objupConfig &cfg) {
    objupBackoffPolicy policy;
    policy.baseDelay = cfg.retryBaseDelay;
    policy.maxDelay = cfg.retryMaxDelay;
    policy.maxAttempts = cfg.maxRetryAttempts;
    return policy;
}

std::chrono::milliseconds
objupBackoffPolicy::delayFor(uint32_t retry, double jitter_sample) const noexcept {
    const double cap = static_cast<double>(maxDelay.count());
    double delay = static_cast<double>(baseDelay.count()) * std::pow(factor, retry);
    delay = std::min(delay, cap);
    delay += delay * jitterRatio * std::clamp(jitter_sample, 0.0, 1.0);
    delay = std::min(delay, cap);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::chrono::milliseconds
objupBackoffPolicy::jitteredDelayFor(uint32_t retry) const {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return delayFor(retry, dist(gen));
}

objup_status_t
objupClassifyRemoteError(int http_code, std::string_view error_code, bool network_error) noexcept {
    if (network_error || http_code <= 0) {
        return OBJUP_ERR_REMOTE_TRANSIENT;
    }
    if (isTransientCode(error_code)) {
        return OBJUP_ERR_REMOTE_TRANSIENT;
    }
    if (http_code == 408 || http_code == 429 || http_code >= 500) {
        return OBJUP_ERR_REMOTE_TRANSIENT;
    }
    // AccessDenied, InvalidAccessKeyId, SignatureDoesNotMatch, RequestTimeTooSkewed,
    // NoSuchBucket, NoSuchUpload and every other 4xx land here.
    return OBJUP_ERR_REMOTE_PERMANENT;
}

void
objupDefaultSleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}
