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

#include "objup_types.h"

std::string
objupEnumStrings::statusStr(const objupStatus &status) {
    switch (status) {
        case OBJUP_IN_PROG:                 return "OBJUP_IN_PROG";
        case OBJUP_SUCCESS:                 return "OBJUP_SUCCESS";
        case OBJUP_ERR_INVALID_PARAM:       return "OBJUP_ERR_INVALID_PARAM";
        case OBJUP_ERR_SIZE_TOO_SMALL:      return "OBJUP_ERR_SIZE_TOO_SMALL";
        case OBJUP_ERR_TOO_MANY_PARTS:      return "OBJUP_ERR_TOO_MANY_PARTS";
        case OBJUP_ERR_REMOTE_TRANSIENT:    return "OBJUP_ERR_REMOTE_TRANSIENT";
        case OBJUP_ERR_REMOTE_PERMANENT:    return "OBJUP_ERR_REMOTE_PERMANENT";
        case OBJUP_ERR_INITIATION_FAILED:   return "OBJUP_ERR_INITIATION_FAILED";
        case OBJUP_ERR_INCOMPLETE_PART_SET: return "OBJUP_ERR_INCOMPLETE_PART_SET";
        case OBJUP_ERR_PARTIAL_UPLOAD:      return "OBJUP_ERR_PARTIAL_UPLOAD";
        case OBJUP_ERR_ABORT_INCOMPLETE:    return "OBJUP_ERR_ABORT_INCOMPLETE";
        case OBJUP_ERR_CANCELED:            return "OBJUP_ERR_CANCELED";
        case OBJUP_ERR_NOT_FOUND:           return "OBJUP_ERR_NOT_FOUND";
        case OBJUP_ERR_NOT_ALLOWED:         return "OBJUP_ERR_NOT_ALLOWED";
        case OBJUP_ERR_MISMATCH:            return "OBJUP_ERR_MISMATCH";
        case OBJUP_ERR_DATA_SOURCE:         return "OBJUP_ERR_DATA_SOURCE";
        default:                            return "BAD_STATUS";
    }
}

std::string
objupEnumStrings::sessionStateStr(const objupSessionState &state) {
    switch (state) {
        case objupSessionState::INITIATING:  return "INITIATING";
        case objupSessionState::IN_PROGRESS: return "IN_PROGRESS";
        case objupSessionState::COMPLETING:  return "COMPLETING";
        case objupSessionState::COMPLETED:   return "COMPLETED";
        case objupSessionState::ABORTING:    return "ABORTING";
        case objupSessionState::ABORTED:     return "ABORTED";
        case objupSessionState::FAILED:      return "FAILED";
        default:                             return "BAD_STATE";
    }
}

std::string
objupEnumStrings::errorCategoryStr(const objupErrorCategory &category) {
    switch (category) {
        case objupErrorCategory::NONE:             return "None";
        case objupErrorCategory::PLANNING:         return "PlanningError";
        case objupErrorCategory::TRANSIENT_REMOTE: return "TransientRemoteError";
        case objupErrorCategory::PERMANENT_REMOTE: return "PermanentRemoteError";
        case objupErrorCategory::PARTIAL_UPLOAD:   return "PartialUploadIncomplete";
        case objupErrorCategory::ABORT_INCOMPLETE: return "AbortIncomplete";
        case objupErrorCategory::LOCAL:            return "LocalError";
        default:                                   return "BAD_CATEGORY";
    }
}

objupErrorCategory
objupCategoryOf(objup_status_t status) noexcept {
    switch (status) {
        case OBJUP_SUCCESS:
        case OBJUP_IN_PROG:
            return objupErrorCategory::NONE;
        case OBJUP_ERR_SIZE_TOO_SMALL:
        case OBJUP_ERR_TOO_MANY_PARTS:
            return objupErrorCategory::PLANNING;
        case OBJUP_ERR_REMOTE_TRANSIENT:
            return objupErrorCategory::TRANSIENT_REMOTE;
        case OBJUP_ERR_REMOTE_PERMANENT:
        case OBJUP_ERR_INITIATION_FAILED:
            return objupErrorCategory::PERMANENT_REMOTE;
        case OBJUP_ERR_PARTIAL_UPLOAD:
            return objupErrorCategory::PARTIAL_UPLOAD;
        case OBJUP_ERR_ABORT_INCOMPLETE:
            return objupErrorCategory::ABORT_INCOMPLETE;
        default:
            return objupErrorCategory::LOCAL;
    }
}
