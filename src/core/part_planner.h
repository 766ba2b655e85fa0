/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef OBJUP_CORE_PART_PLANNER_H
#define OBJUP_CORE_PART_PLANNER_H

#include <cstdint>
#include <vector>

#include "objup_types.h"

/**
 * Splits an object into multipart upload parts. Stateless and deterministic.
 */
class objupPartPlanner {
public:
    /**
     * Compute the part layout of an object.
     *
     * When the configured part size yields more than max_part_count parts, the part size is
     * recomputed once as ceil(total_size / max_part_count) rounded up to a multiple of
     * alignment.
     *
     * @param total_size           Object size in bytes
     * @param configured_part_size Requested part size, raised to min_part_size if smaller
     * @param min_part_size        Smallest non-final part the store accepts
     * @param max_part_count       Largest part count the store accepts
     * @param alignment            Granularity of a recomputed part size
     * @param plan                 Filled on success
     * @return OBJUP_SUCCESS, OBJUP_ERR_SIZE_TOO_SMALL when total_size < 2 * min_part_size
     *         (use a single put instead), OBJUP_ERR_TOO_MANY_PARTS, or
     *         OBJUP_ERR_INVALID_PARAM for zero sizes or counts
     */
    [[nodiscard]] static objup_status_t
    plan(uint64_t total_size,
         uint64_t configured_part_size,
         uint64_t min_part_size,
         uint32_t max_part_count,
         uint64_t alignment,
         objupUploadPlan &plan);

    /**
     * Byte range of a 1-based part number. The part number must be within the plan.
     */
    [[nodiscard]] static objupByteRange
    partRange(const objupUploadPlan &plan, uint32_t part_number) noexcept;

    /**
     * Tasks for every part of the plan, in ascending part number order.
     */
    [[nodiscard]] static std::vector<objupPartTask>
    makeTasks(const objupUploadPlan &plan);
};

#endif // OBJUP_CORE_PART_PLANNER_H
