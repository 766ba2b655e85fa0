/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "part_semaphore.h"

#include <algorithm>
#include <stdexcept>

#include "common/objup_log.h"

objupPartSemaphore::objupPartSemaphore(uint32_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("part semaphore capacity must be positive");
    }
}

bool
objupPartSemaphore::tryAcquireFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return inUse_ < capacity_; })) {
        return false;
    }
    ++inUse_;
    peak_ = std::max(peak_, inUse_);
    return true;
}

void
objupPartSemaphore::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        OBJUP_ASSERT_ALWAYS(inUse_ > 0) << "part semaphore released more than acquired";
        --inUse_;
    }
    cv_.notify_one();
}

uint32_t
objupPartSemaphore::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - inUse_;
}

uint32_t
objupPartSemaphore::peakInUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}
