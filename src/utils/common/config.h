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

#ifndef OBJUP_SRC_UTILS_COMMON_CONFIG_H
#define OBJUP_SRC_UTILS_COMMON_CONFIG_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <strings.h> // strcasecmp
#include <type_traits>
#include <vector>

#include "common/objup_log.h"
#include "common/str_tools.h"

namespace objup::config {

[[nodiscard]] inline std::optional<std::string>
getenvOptional(const std::string &name) {
    if (const char *value = std::getenv(name.c_str())) {
        OBJUP_DEBUG << "Obtained environment variable " << name << "=" << value;
        return std::string(value);
    }
    OBJUP_DEBUG << "Missing environment variable " << name;
    return std::nullopt;
}

template<typename, typename = void> struct convertTraits;

template<>
struct convertTraits<bool> {
    [[nodiscard]] static bool
    convert(const std::string &value) {
        static const std::vector<std::string> positive = {
            "y", "yes", "on", "1", "true", "enable"
        };

        static const std::vector<std::string> negative = {
            "n", "no", "off", "0", "false", "disable"
        };

        if (match(value, positive)) {
            return true;
        }

        if (match(value, negative)) {
            return false;
        }

        OBJUP_ERROR << "Unknown value for bool '"
                    << value
                    << "' known are "
                    << strJoin(positive)
                    << " as positive and "
                    << strJoin(negative)
                    << " as negative (case insensitive)";
        throw std::runtime_error("Conversion to bool failed");
    }

private:
    [[nodiscard]] static bool
    match(const std::string &value, const std::vector<std::string> &haystack) noexcept {
        const auto pred = [&](const std::string &ref) {
            return strcasecmp(ref.c_str(), value.c_str()) == 0;
        };
        return std::find_if(haystack.begin(), haystack.end(), pred) != haystack.end();
    }
};

template<>
struct convertTraits<std::string> {
    [[nodiscard]] static std::string
    convert(const std::string &value) {
        return value;
    }
};

// Unsigned values may be written in hex with a 0x prefix, signed ones are decimal only.
// Leading signs on unsigned values, whitespace and trailing characters are rejected.
template<typename integer, typename longLong>
struct integerTraits {
    static_assert(std::is_signed_v<integer> == std::is_signed_v<longLong>);
    static_assert(std::is_unsigned_v<integer> == std::is_unsigned_v<longLong>);

    [[nodiscard]] static integer
    convert(const std::string &value) {
        const size_t digits_at = (std::is_signed_v<integer> && !value.empty() && value[0] == '-') ? 1 : 0;
        if (value.size() <= digits_at || !std::isdigit(static_cast<unsigned char>(value[digits_at]))) {
            throw std::runtime_error("Invalid integer");
        }
        size_t pos = 0;
        longLong ll;
        if constexpr (std::is_unsigned_v<integer>) {
            const bool hex = value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X');
            ll = std::stoull(value, &pos, hex ? 16 : 10);
        } else {
            ll = std::stoll(value, &pos, 10);
        }
        if (pos != value.size()) {
            throw std::runtime_error("Invalid integer");
        }
        if constexpr (sizeof(integer) < sizeof(longLong)) {
            if (longLong(integer(ll)) != ll) {
                throw std::runtime_error("Integer overflow");
            }
        }
        return integer(ll);
    }
};

template<typename integer>
struct convertTraits<integer, std::enable_if_t<std::is_integral_v<integer> && std::is_signed_v<integer>>>
    : integerTraits<integer, long long> {};

template<typename integer>
struct convertTraits<integer,
                     std::enable_if_t<std::is_integral_v<integer> && std::is_unsigned_v<integer> &&
                                      !std::is_same_v<integer, bool>>>
    : integerTraits<integer, unsigned long long> {};

template<typename rep, typename period>
struct convertTraits<std::chrono::duration<rep, period>> {
    [[nodiscard]] static std::chrono::duration<rep, period>
    convert(const std::string &value) {
        return std::chrono::duration<rep, period>(convertTraits<rep>::convert(value));
    }
};

/**
 * Value of the environment variable env converted to type, or fallback when it is unset.
 * Throws std::runtime_error when the variable is set but cannot be converted.
 */
template<typename type, template<typename...> class traits = convertTraits>
[[nodiscard]] type
getValueDefaulted(const std::string &env, const type &fallback) {
    const auto opt = getenvOptional(env);
    if (!opt) {
        return fallback;
    }
    try {
        return traits<type>::convert(*opt);
    }
    catch (const std::invalid_argument &) {
        throw std::runtime_error("Malformed value '" + *opt + "' in " + env);
    }
    catch (const std::out_of_range &) {
        throw std::runtime_error("Out of range value '" + *opt + "' in " + env);
    }
}

} // namespace objup::config

#endif
