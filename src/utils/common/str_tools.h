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
#ifndef OBJUP_SRC_UTILS_COMMON_STR_TOOLS_H
#define OBJUP_SRC_UTILS_COMMON_STR_TOOLS_H

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>

#include "objup_types.h"

namespace objup {

/* Object keys are limited to 1024 bytes by S3-compatible stores */
constexpr size_t maxObjectKeyLength = 1024;

/* Metadata prefix the wire layer adds to every user metadata entry */
constexpr std::string_view userMetadataPrefix = "x-amz-meta-";

/* Length of the UTF-8 sequence started by lead byte c, 0 when c cannot start one */
inline size_t
utf8SequenceLength(unsigned char c) {
    if (c < 0x80) {
        return 1;
    }
    if (c >= 0xC2 && c <= 0xDF) {
        return 2;
    }
    if (c >= 0xE0 && c <= 0xEF) {
        return 3;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        return 4;
    }
    return 0;
}

/* Well formed UTF-8: no stray continuation bytes, overlong forms, surrogates or values past U+10FFFF */
inline bool
isValidUtf8(std::string_view str) {
    size_t i = 0;
    while (i < str.size()) {
        const auto lead = static_cast<unsigned char>(str[i]);
        const size_t len = utf8SequenceLength(lead);
        if (len == 0 || i + len > str.size()) {
            return false;
        }
        for (size_t j = 1; j < len; ++j) {
            if ((static_cast<unsigned char>(str[i + j]) & 0xC0) != 0x80) {
                return false;
            }
        }
        if (len > 2) {
            const auto second = static_cast<unsigned char>(str[i + 1]);
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
                (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

/* Cut str to at most max bytes without leaving a partial UTF-8 sequence at the end */
inline void
truncateUtf8(std::string &str, size_t max) {
    if (str.size() <= max) {
        return;
    }
    str.resize(max);
    size_t start = str.size();
    while (start > 0 && (static_cast<unsigned char>(str[start - 1]) & 0xC0) == 0x80) {
        --start;
    }
    if (start == 0) {
        return;
    }
    const size_t len = utf8SequenceLength(static_cast<unsigned char>(str[start - 1]));
    if (len > 1 && start - 1 + len > str.size()) {
        str.resize(start - 1);
    }
}

/**
 * Turn a caller supplied path into an object key: backslashes become slashes, control
 * characters are dropped, runs of slashes collapse, a leading slash is removed and the
 * result is cut to maxObjectKeyLength on a character boundary.
 */
inline std::string
sanitizeObjectKey(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c == '\\') {
            c = '/';
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            continue;
        }
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }
    if (!out.empty() && out.front() == '/') {
        out.erase(0, 1);
    }
    truncateUtf8(out, maxObjectKeyLength);
    return out;
}

inline bool
isValidObjectKey(std::string_view key) {
    if (key.empty() || key.size() > maxObjectKeyLength) {
        return false;
    }
    static constexpr std::string_view forbidden("\x00\x08\x0B\x0C\x0E\x1F", 6);
    return key.find_first_of(forbidden) == std::string_view::npos && isValidUtf8(key);
}

/**
 * Content type guessed from the extension of a file name or object key, matched case
 * insensitively. Unknown or missing extensions give application/octet-stream.
 */
inline std::string
contentTypeFor(std::string_view name) {
    static constexpr std::pair<std::string_view, std::string_view> types[] = {
        {"txt", "text/plain"},
        {"log", "text/plain"},
        {"md", "text/markdown"},
        {"csv", "text/csv"},
        {"htm", "text/html"},
        {"html", "text/html"},
        {"css", "text/css"},
        {"js", "text/javascript"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"yaml", "application/yaml"},
        {"yml", "application/yaml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tgz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"bz2", "application/x-bzip2"},
        {"7z", "application/x-7z-compressed"},
        {"parquet", "application/vnd.apache.parquet"},
        {"wasm", "application/wasm"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"webp", "image/webp"},
        {"ico", "image/vnd.microsoft.icon"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
        {"mov", "video/quicktime"},
    };
    static constexpr std::string_view fallback = "application/octet-stream";

    const size_t slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    const size_t dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return std::string(fallback);
    }
    const std::string ext = absl::AsciiStrToLower(name.substr(dot + 1));
    for (const auto &[suffix, type] : types) {
        if (suffix == ext) {
            return std::string(type);
        }
    }
    return std::string(fallback);
}

/**
 * Strip the x-amz-meta- prefix callers sometimes put on metadata keys, the object store
 * adds it on the wire. Later duplicates win.
 */
inline objup_metadata_t
normalizeMetadata(const objup_metadata_t &metadata) {
    objup_metadata_t out;
    for (const auto &[key, value] : metadata) {
        std::string_view name(key);
        if (absl::StartsWithIgnoreCase(name, userMetadataPrefix)) {
            name.remove_prefix(userMetadataPrefix.size());
        }
        if (name.empty()) {
            continue;
        }
        out[std::string(name)] = value;
    }
    return out;
}

} // namespace objup

template<typename container>
std::string
strJoin(const container &strings, const std::string &delim = ", ") {
    if (strings.empty()) {
        return "";
    }

    auto iter = strings.begin();
    std::string result = *iter;

    for (++iter; iter != strings.end(); ++iter) {
        result += delim;
        result += *iter;
    }
    return result;
}

#endif
