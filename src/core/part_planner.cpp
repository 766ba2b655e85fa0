/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "part_planner.h"
#include "common/objup_log.h"

#include <algorithm>
#include <limits>

#include <absl/strings/str_format.h>

namespace {

uint64_t
ceilDiv(uint64_t num, uint64_t den) noexcept {
    return num / den + (num % den != 0);
}

} // namespace

objup_status_t
objupPartPlanner::plan(uint64_t total_size,
                       uint64_t configured_part_size,
                       uint64_t min_part_size,
                       uint32_t max_part_count,
                       uint64_t alignment,
                       objupUploadPlan &plan) {
    if (configured_part_size == 0 || min_part_size == 0 || max_part_count == 0 || alignment == 0) {
        OBJUP_ERROR << absl::StrFormat(
            "Invalid planning parameters: part_size=%d min_part_size=%d max_parts=%d alignment=%d",
            configured_part_size,
            min_part_size,
            max_part_count,
            alignment);
        return OBJUP_ERR_INVALID_PARAM;
    }

    if (min_part_size > std::numeric_limits<uint64_t>::max() / 2 ||
        total_size < 2 * min_part_size) {
        OBJUP_DEBUG << absl::StrFormat(
            "Object of %d bytes is below the multipart threshold of %d bytes",
            total_size,
            2 * min_part_size);
        return OBJUP_ERR_SIZE_TOO_SMALL;
    }

    uint64_t part_size = std::max(configured_part_size, min_part_size);
    uint64_t part_count = ceilDiv(total_size, part_size);

    if (part_count > max_part_count) {
        const uint64_t needed = ceilDiv(total_size, max_part_count);
        const uint64_t aligned = ceilDiv(needed, alignment);
        if (aligned > std::numeric_limits<uint64_t>::max() / alignment) {
            return OBJUP_ERR_TOO_MANY_PARTS;
        }
        const uint64_t recomputed = std::max(aligned * alignment, min_part_size);

        OBJUP_INFO << absl::StrFormat(
            "Part size %d gives %d parts for %d bytes, more than the limit of %d; using %d",
            part_size,
            part_count,
            total_size,
            max_part_count,
            recomputed);

        part_size = recomputed;
        part_count = ceilDiv(total_size, part_size);
        if (part_count > max_part_count) {
            OBJUP_ERROR << absl::StrFormat(
                "Object of %d bytes needs %d parts of %d bytes, limit is %d",
                total_size,
                part_count,
                part_size,
                max_part_count);
            return OBJUP_ERR_TOO_MANY_PARTS;
        }
    }

    plan.totalSize = total_size;
    plan.partSize = part_size;
    plan.partCount = static_cast<uint32_t>(part_count);

    OBJUP_ASSERT(plan.lastPartSize() > 0 && plan.lastPartSize() <= plan.partSize);
    return OBJUP_SUCCESS;
}

objupByteRange
objupPartPlanner::partRange(const objupUploadPlan &plan, uint32_t part_number) noexcept {
    objupByteRange range;
    range.start = static_cast<uint64_t>(part_number - 1) * plan.partSize;
    range.end = std::min(range.start + plan.partSize, plan.totalSize);
    return range;
}

std::vector<objupPartTask>
objupPartPlanner::makeTasks(const objupUploadPlan &plan) {
    std::vector<objupPartTask> tasks;
    tasks.reserve(plan.partCount);
    for (uint32_t n = 1; n <= plan.partCount; ++n) {
        objupPartTask task;
        task.partNumber = n;
        task.byteRange = partRange(plan, n);
        task.attempt = 0;
        tasks.push_back(task);
    }
    return tasks;
}
