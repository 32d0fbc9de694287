// BSD 3-Clause License
//
// Copyright (c) 2021-2025, kcenon
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

/**
 * @file config_parser.h
 * @brief Typed lookups over flat key/value configuration
 *
 * Usage:
 * @code
 * using kcenon::vsm::config_parser;
 *
 * config_map config = {{"variety.initial_capacity", "2.0"},
 *                      {"variety.assessment_interval", "5s"}};
 *
 * double capacity = config_parser::get<double>(config, "variety.initial_capacity", 1.0);
 * auto interval = config_parser::get_duration<std::chrono::milliseconds>(
 *     config, "variety.assessment_interval", std::chrono::milliseconds(5000));
 * @endcode
 */

#include <cctype>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace kcenon::vsm {

/**
 * @brief Type alias for configuration map
 */
using config_map = std::unordered_map<std::string, std::string>;

/**
 * @class config_parser
 * @brief Type-safe parsing of configuration values with default support
 */
class config_parser {
   public:
    /**
     * @brief Get a configuration value with type conversion
     * @tparam T The target type (bool, integral, floating point, std::string)
     * @param config The configuration map
     * @param key The configuration key to look up
     * @param default_value The default value if key is not found or parsing fails
     */
    template <typename T>
    static T get(const config_map& config, const std::string& key, const T& default_value) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }
        auto parsed = parse_value_optional<T>(it->second);
        return parsed ? *parsed : default_value;
    }

    /**
     * @brief Get a configuration value as optional
     */
    template <typename T>
    static std::optional<T> get_optional(const config_map& config, const std::string& key) {
        auto it = config.find(key);
        if (it == config.end()) {
            return std::nullopt;
        }
        return parse_value_optional<T>(it->second);
    }

    static bool has_key(const config_map& config, const std::string& key) {
        return config.find(key) != config.end();
    }

    /**
     * @brief Get a configuration value clamped to [min_value, max_value]
     */
    template <typename T>
    static T get_clamped(const config_map& config, const std::string& key, const T& default_value,
                         const T& min_value, const T& max_value) {
        static_assert(std::is_arithmetic_v<T>, "get_clamped requires arithmetic type");
        T value = get<T>(config, key, default_value);
        if (value < min_value) {
            return min_value;
        }
        if (value > max_value) {
            return max_value;
        }
        return value;
    }

    /**
     * @brief Get a duration value from configuration
     *
     * Supported formats:
     * - Plain number: interpreted in the Duration's unit
     * - With suffix: 100ms, 5s, 2m, 1h
     */
    template <typename Duration>
    static Duration get_duration(const config_map& config, const std::string& key,
                                 const Duration& default_value) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }
        return parse_duration<Duration>(it->second, default_value);
    }

    /**
     * @brief Get a comma-separated list, trimming whitespace around items
     *
     * Empty items are skipped.
     */
    static std::vector<std::string> get_list(const config_map& config, const std::string& key,
                                             const std::vector<std::string>& default_value = {}) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }

        std::vector<std::string> items;
        std::string current;
        auto flush = [&items, &current]() {
            size_t begin = 0;
            size_t end = current.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(current[begin]))) {
                ++begin;
            }
            while (end > begin && std::isspace(static_cast<unsigned char>(current[end - 1]))) {
                --end;
            }
            if (end > begin) {
                items.push_back(current.substr(begin, end - begin));
            }
            current.clear();
        };
        for (char c : it->second) {
            if (c == ',') {
                flush();
            } else {
                current.push_back(c);
            }
        }
        flush();
        return items;
    }

   private:
    template <typename T>
    static std::optional<T> parse_value_optional(const std::string& str) {
        try {
            if constexpr (std::is_same_v<T, bool>) {
                return parse_bool(str);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return str;
            } else if constexpr (std::is_integral_v<T>) {
                if constexpr (std::is_signed_v<T>) {
                    return static_cast<T>(std::stoll(str));
                } else {
                    return static_cast<T>(std::stoull(str));
                }
            } else if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(std::stod(str));
            } else {
                return std::nullopt;
            }
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Parse boolean value from string ("true", "1", "yes", "on" -> true)
     */
    static bool parse_bool(const std::string& str) {
        std::string lower = str;
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
    }

    template <typename Duration>
    static Duration parse_duration(const std::string& str, const Duration& default_value) {
        if (str.empty()) {
            return default_value;
        }

        size_t suffix_start = str.find_first_not_of("0123456789");
        long long value = 0;
        try {
            value = std::stoll(str.substr(0, suffix_start));
        } catch (const std::invalid_argument&) {
            return default_value;
        } catch (const std::out_of_range&) {
            return default_value;
        }

        if (suffix_start == std::string::npos) {
            return Duration(value);
        }

        std::string suffix = str.substr(suffix_start);
        while (!suffix.empty() && std::isspace(static_cast<unsigned char>(suffix.front()))) {
            suffix.erase(0, 1);
        }
        for (auto& c : suffix) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (suffix == "ms") {
            return std::chrono::duration_cast<Duration>(std::chrono::milliseconds(value));
        } else if (suffix == "s" || suffix == "sec") {
            return std::chrono::duration_cast<Duration>(std::chrono::seconds(value));
        } else if (suffix == "m" || suffix == "min") {
            return std::chrono::duration_cast<Duration>(std::chrono::minutes(value));
        } else if (suffix == "h") {
            return std::chrono::duration_cast<Duration>(std::chrono::hours(value));
        }
        return default_value;
    }
};

}  // namespace kcenon::vsm
