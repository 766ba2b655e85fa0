/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef OBJUP_CORE_PART_SEMAPHORE_H
#define OBJUP_CORE_PART_SEMAPHORE_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

/**
 * Counting semaphore bounding the parts in flight across every session of a coordinator.
 * Sessions get it by reference for the duration of submitParts().
 */
class objupPartSemaphore {
public:
    explicit objupPartSemaphore(uint32_t capacity);

    objupPartSemaphore(const objupPartSemaphore &) = delete;
    objupPartSemaphore &
    operator=(const objupPartSemaphore &) = delete;

    /** Wait up to timeout for a slot. Returns true when a slot was taken. */
    [[nodiscard]] bool
    tryAcquireFor(std::chrono::milliseconds timeout);

    void
    release();

    [[nodiscard]] uint32_t
    available() const;

    [[nodiscard]] uint32_t
    capacity() const noexcept {
        return capacity_;
    }

    /** Highest number of slots ever held at the same time */
    [[nodiscard]] uint32_t
    peakInUse() const;

private:
    const uint32_t capacity_;
    uint32_t inUse_ = 0;
    uint32_t peak_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

#endif // OBJUP_CORE_PART_SEMAPHORE_H
