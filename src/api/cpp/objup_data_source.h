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
#ifndef _OBJUP_DATA_SOURCE_H
#define _OBJUP_DATA_SOURCE_H

#include <cstdint>
#include <string>
#include <vector>

#include "objup_types.h"

/**
 * @class objupDataSource
 * @brief Random access byte source of an upload.
 *
 * read() is called concurrently from the worker pool for disjoint ranges, implementations
 * must allow that without serializing callers.
 */
class objupDataSource {
public:
    virtual ~objupDataSource() = default;

    /**
     * @brief  Total number of bytes of the source
     */
    [[nodiscard]] virtual uint64_t
    size() const = 0;

    /**
     * @brief  Copy exactly len bytes starting at offset into dest.
     * @return OBJUP_SUCCESS, OBJUP_ERR_INVALID_PARAM for a range past the end,
     *         OBJUP_ERR_DATA_SOURCE when the underlying read fails
     */
    [[nodiscard]] virtual objup_status_t
    read(uint64_t offset, size_t len, char *dest) const = 0;
};

/**
 * @class objupMemorySource
 * @brief Data source over a caller owned buffer, which must outlive the upload
 */
class objupMemorySource : public objupDataSource {
public:
    objupMemorySource(const void *data, uint64_t len)
        : data_(static_cast<const char *>(data)),
          len_(len) {}

    explicit objupMemorySource(const std::vector<char> &buf)
        : objupMemorySource(buf.data(), buf.size()) {}

    uint64_t
    size() const override {
        return len_;
    }

    objup_status_t
    read(uint64_t offset, size_t len, char *dest) const override;

private:
    const char *data_;
    uint64_t len_;
};

/**
 * @class objupFileSource
 * @brief Data source over a regular file, read with pread() so concurrent reads do not
 *        share a file offset. Throws std::runtime_error when the file cannot be opened.
 */
class objupFileSource : public objupDataSource {
public:
    explicit objupFileSource(const std::string &path);
    ~objupFileSource();

    objupFileSource(const objupFileSource &) = delete;
    objupFileSource &
    operator=(const objupFileSource &) = delete;

    uint64_t
    size() const override {
        return size_;
    }

    objup_status_t
    read(uint64_t offset, size_t len, char *dest) const override;

    const std::string &
    path() const {
        return path_;
    }

private:
    std::string path_;
    int fd_ = -1;
    uint64_t size_ = 0;
};

#endif
