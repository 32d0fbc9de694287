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
 * @file error_codes.h
 * @brief Error codes for the intelligence layer
 *
 * Codes are grouped into ranges by category, following the convention
 * shared by the kcenon system libraries.
 */

#include <cstdint>
#include <string>

namespace kcenon::vsm {

/**
 * @enum vsm_error_code
 * @brief Error codes for scanner, pattern, variety and adaptation operations
 */
enum class vsm_error_code : std::uint32_t {
    // Success
    success = 0,

    // General errors (1000-1999)
    invalid_argument = 1000,
    not_found = 1001,
    already_exists = 1002,
    invalid_state = 1003,
    operation_failed = 1004,

    // Lifecycle errors (2000-2999)
    already_started = 2000,
    not_running = 2001,
    operation_cancelled = 2002,

    // Configuration errors (3000-3999)
    invalid_configuration = 3000,
    unknown_protocol_action = 3001,

    // Validation errors (4000-4999)
    validation_failed = 4000,
    malformed_snapshot = 4001,

    // Capacity errors (5000-5999)
    capacity_exceeded = 5000,
    resource_denied = 5001,

    // Monitoring errors (6000-6999)
    progress_probe_failed = 6000,
    source_unavailable = 6001,

    // Serialization errors (7000-7999)
    parse_error = 7000,

    // Unknown error
    unknown_error = 9999
};

/**
 * @brief Convert error code to string representation
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string error_code_to_string(vsm_error_code code) {
    switch (code) {
        case vsm_error_code::success:
            return "Success";

        // General errors
        case vsm_error_code::invalid_argument:
            return "Invalid argument";
        case vsm_error_code::not_found:
            return "Not found";
        case vsm_error_code::already_exists:
            return "Already exists";
        case vsm_error_code::invalid_state:
            return "Invalid state";
        case vsm_error_code::operation_failed:
            return "Operation failed";

        // Lifecycle errors
        case vsm_error_code::already_started:
            return "Already started";
        case vsm_error_code::not_running:
            return "Not running";
        case vsm_error_code::operation_cancelled:
            return "Operation cancelled";

        // Configuration errors
        case vsm_error_code::invalid_configuration:
            return "Invalid configuration";
        case vsm_error_code::unknown_protocol_action:
            return "Unknown protocol action";

        // Validation errors
        case vsm_error_code::validation_failed:
            return "Validation failed";
        case vsm_error_code::malformed_snapshot:
            return "Malformed signal snapshot";

        // Capacity errors
        case vsm_error_code::capacity_exceeded:
            return "Capacity exceeded";
        case vsm_error_code::resource_denied:
            return "Resource allocation denied";

        // Monitoring errors
        case vsm_error_code::progress_probe_failed:
            return "Progress probe failed";
        case vsm_error_code::source_unavailable:
            return "Signal source unavailable";

        // Serialization errors
        case vsm_error_code::parse_error:
            return "Parse error";

        case vsm_error_code::unknown_error:
        default:
            return "Unknown error";
    }
}

} // namespace kcenon::vsm
