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

#include "kcenon/vsm/variety/variety_types.h"

#include <cerrno>
#include <cstdlib>
#include <map>
#include <sstream>

namespace kcenon::vsm {

namespace {

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::hexfloat << value;
    return oss.str();
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return errno == 0 && end == text.c_str() + text.size();
}

bool parse_unsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || text.front() == '-') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    out = std::strtoull(text.c_str(), &end, 10);
    return errno == 0 && end == text.c_str() + text.size();
}

} // namespace

std::string variety_state::serialize() const {
    std::ostringstream oss;
    oss << "current_variety_level=" << format_double(current_variety_level) << '\n'
        << "internal_variety_capacity=" << format_double(internal_variety_capacity) << '\n'
        << "variety_ratio=" << format_double(variety_ratio) << '\n'
        << "explosion_events=" << explosion_events << '\n'
        << "cascade_predictions=" << cascade_predictions << '\n'
        << "peak_variety=" << format_double(metrics.peak_variety) << '\n'
        << "average_variety=" << format_double(metrics.average_variety) << '\n'
        << "explosion_count=" << metrics.explosion_count << '\n'
        << "cascade_events=" << metrics.cascade_events << '\n'
        << "absorption_rate=" << format_double(metrics.absorption_rate) << '\n'
        << "recovery_time_seconds=" << format_double(metrics.recovery_time_seconds) << '\n'
        << "monitoring_active=" << (monitoring_active ? 1 : 0) << '\n';
    return oss.str();
}

result<variety_state> variety_state::deserialize(const std::string& text) {
    std::map<std::string, std::string> fields;
    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        if (line.empty()) {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            return make_error<variety_state>(vsm_error_code::parse_error,
                                             "Malformed line: " + line);
        }
        if (!fields.emplace(line.substr(0, eq), line.substr(eq + 1)).second) {
            return make_error<variety_state>(vsm_error_code::parse_error,
                                             "Duplicate key: " + line.substr(0, eq));
        }
    }

    variety_state state;
    std::string failed_key;
    auto read_double = [&fields, &failed_key](const char* key, double& out) {
        auto it = fields.find(key);
        if (it == fields.end() || !parse_double(it->second, out)) {
            if (failed_key.empty()) {
                failed_key = key;
            }
        }
    };
    auto read_unsigned = [&fields, &failed_key](const char* key, uint64_t& out) {
        auto it = fields.find(key);
        if (it == fields.end() || !parse_unsigned(it->second, out)) {
            if (failed_key.empty()) {
                failed_key = key;
            }
        }
    };

    uint64_t explosion_events = 0;
    uint64_t cascade_predictions = 0;
    uint64_t monitoring_active = 0;

    read_double("current_variety_level", state.current_variety_level);
    read_double("internal_variety_capacity", state.internal_variety_capacity);
    read_double("variety_ratio", state.variety_ratio);
    read_unsigned("explosion_events", explosion_events);
    read_unsigned("cascade_predictions", cascade_predictions);
    read_double("peak_variety", state.metrics.peak_variety);
    read_double("average_variety", state.metrics.average_variety);
    read_unsigned("explosion_count", state.metrics.explosion_count);
    read_unsigned("cascade_events", state.metrics.cascade_events);
    read_double("absorption_rate", state.metrics.absorption_rate);
    read_double("recovery_time_seconds", state.metrics.recovery_time_seconds);
    read_unsigned("monitoring_active", monitoring_active);

    if (!failed_key.empty()) {
        return make_error<variety_state>(vsm_error_code::parse_error,
                                         "Missing or invalid field: " + failed_key);
    }
    if (monitoring_active > 1) {
        return make_error<variety_state>(vsm_error_code::parse_error,
                                         "monitoring_active must be 0 or 1");
    }

    state.explosion_events = static_cast<size_t>(explosion_events);
    state.cascade_predictions = static_cast<size_t>(cascade_predictions);
    state.monitoring_active = monitoring_active == 1;
    return make_success(std::move(state));
}

bool variety_state::operator==(const variety_state& other) const {
    return current_variety_level == other.current_variety_level &&
           internal_variety_capacity == other.internal_variety_capacity &&
           variety_ratio == other.variety_ratio &&
           explosion_events == other.explosion_events &&
           cascade_predictions == other.cascade_predictions &&
           metrics.peak_variety == other.metrics.peak_variety &&
           metrics.average_variety == other.metrics.average_variety &&
           metrics.explosion_count == other.metrics.explosion_count &&
           metrics.cascade_events == other.metrics.cascade_events &&
           metrics.absorption_rate == other.metrics.absorption_rate &&
           metrics.recovery_time_seconds == other.metrics.recovery_time_seconds &&
           monitoring_active == other.monitoring_active;
}

} // namespace kcenon::vsm
