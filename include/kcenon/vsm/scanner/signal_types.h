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
 * @file signal_types.h
 * @brief Environmental signal records produced by the scanner
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::vsm {

/**
 * @enum scan_scope
 * @brief Breadth of an environmental scan
 */
enum class scan_scope {
    full,      ///< All four signal families
    partial,   ///< Market and competitive signals
    targeted   ///< Competitive signals only
};

constexpr const char* to_string(scan_scope scope) noexcept {
    switch (scope) {
        case scan_scope::full: return "full";
        case scan_scope::partial: return "partial";
        case scan_scope::targeted: return "targeted";
        default: return "unknown";
    }
}

/**
 * @brief Coverage fraction reported for a scope
 */
constexpr double scope_coverage(scan_scope scope) noexcept {
    switch (scope) {
        case scan_scope::full: return 1.0;
        case scan_scope::partial: return 0.6;
        case scan_scope::targeted: return 0.3;
        default: return 0.0;
    }
}

/**
 * @enum impact_level
 * @brief Qualitative impact used by trend, regulatory and competitive signals
 */
enum class impact_level { low, medium, high };

constexpr const char* to_string(impact_level level) noexcept {
    switch (level) {
        case impact_level::low: return "low";
        case impact_level::medium: return "medium";
        case impact_level::high: return "high";
        default: return "unknown";
    }
}

/**
 * @brief Numeric weight of an impact level when signals are streamed
 */
constexpr double impact_weight(impact_level level) noexcept {
    switch (level) {
        case impact_level::low: return 0.2;
        case impact_level::medium: return 0.5;
        case impact_level::high: return 0.9;
        default: return 0.0;
    }
}

struct market_signal {
    std::string signal;
    double strength{0.0};   ///< [0, 1]
    std::string source;
};

struct technology_trend {
    std::string trend;
    impact_level impact{impact_level::medium};
    std::string timeline;
};

struct regulatory_update {
    std::string regulation;
    std::string status;
    impact_level impact{impact_level::medium};
};

struct competitive_move {
    std::string competitor;
    std::string action;
    impact_level threat_level{impact_level::medium};
};

/**
 * @struct variety_data
 * @brief Variety indicators attached to a snapshot
 *
 * Each list holds the identifiers of observed items; only the counts feed
 * the external variety calculation.
 */
struct variety_data {
    std::vector<std::string> novel_patterns;
    std::vector<std::string> emergent_properties;
    std::vector<std::string> recursive_potential;
    std::vector<std::string> meta_system_seeds;
    bool quantum_superposition{false};
};

/**
 * @struct signal_snapshot
 * @brief Structured result of one environmental scan
 */
struct signal_snapshot {
    scan_scope scope{scan_scope::full};
    double coverage{1.0};
    std::vector<market_signal> market_signals;
    std::vector<technology_trend> technology_trends;
    std::vector<regulatory_update> regulatory_updates;
    std::vector<competitive_move> competitive_moves;
    std::optional<variety_data> llm_variety;
    bool source_available{true};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    size_t signal_count() const {
        return market_signals.size() + technology_trends.size() +
               regulatory_updates.size() + competitive_moves.size();
    }

    bool empty() const { return signal_count() == 0 && !llm_variety.has_value(); }
};

} // namespace kcenon::vsm
