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

#include "objup_data_source.h"
#include "common/objup_log.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <absl/strings/str_format.h>

namespace {

bool
isValidRange(uint64_t offset, size_t len, uint64_t total) {
    return offset <= total && len <= total - offset;
}

} // namespace

objup_status_t
objupMemorySource::read(uint64_t offset, size_t len, char *dest) const {
    if (!isValidRange(offset, len, len_)) {
        OBJUP_ERROR << absl::StrFormat(
            "Memory source read [%d, %d) past end %d", offset, offset + len, len_);
        return OBJUP_ERR_INVALID_PARAM;
    }
    std::memcpy(dest, data_ + offset, len);
    return OBJUP_SUCCESS;
}

objupFileSource::objupFileSource(const std::string &path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::runtime_error(absl::StrFormat(
            "Failed to open upload source '%s': %s", path, std::strerror(errno)));
    }

    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        const int err = errno;
        ::close(fd_);
        throw std::runtime_error(absl::StrFormat(
            "Failed to stat upload source '%s': %s", path, std::strerror(err)));
    }
    size_ = static_cast<uint64_t>(st.st_size);
    OBJUP_DEBUG << "Opened upload source " << path << " of " << size_ << " bytes";
}

objupFileSource::~objupFileSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

objup_status_t
objupFileSource::read(uint64_t offset, size_t len, char *dest) const {
    if (!isValidRange(offset, len, size_)) {
        OBJUP_ERROR << absl::StrFormat(
            "File source %s read [%d, %d) past end %d", path_, offset, offset + len, size_);
        return OBJUP_ERR_INVALID_PARAM;
    }

    size_t done = 0;
    while (done < len) {
        const ssize_t ret = ::pread(fd_, dest + done, len - done, static_cast<off_t>(offset + done));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            OBJUP_ERROR << absl::StrFormat(
                "pread of %s at %d failed: %s", path_, offset + done, std::strerror(errno));
            return OBJUP_ERR_DATA_SOURCE;
        }
        if (ret == 0) {
            // file shrank after it was opened
            OBJUP_ERROR << absl::StrFormat(
                "Unexpected end of %s at %d, expected %d bytes", path_, offset + done, size_);
            return OBJUP_ERR_DATA_SOURCE;
        }
        done += static_cast<size_t>(ret);
    }
    return OBJUP_SUCCESS;
}
