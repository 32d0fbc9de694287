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
 * @file variety_types.h
 * @brief Risk, cascade and explosion records of the variety monitor
 */

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "../core/result_types.h"

namespace kcenon::vsm {

enum class variety_trend { increasing, stable, decreasing };

constexpr const char* to_string(variety_trend trend) noexcept {
    switch (trend) {
        case variety_trend::increasing: return "increasing";
        case variety_trend::stable: return "stable";
        case variety_trend::decreasing: return "decreasing";
        default: return "unknown";
    }
}

enum class recommended_action {
    immediate_meta_system_spawn,
    emergency_absorption,
    increase_internal_variety,
    selective_filtering,
    monitor
};

constexpr const char* to_string(recommended_action action) noexcept {
    switch (action) {
        case recommended_action::immediate_meta_system_spawn: return "immediate_meta_system_spawn";
        case recommended_action::emergency_absorption: return "emergency_absorption";
        case recommended_action::increase_internal_variety: return "increase_internal_variety";
        case recommended_action::selective_filtering: return "selective_filtering";
        case recommended_action::monitor: return "monitor";
        default: return "unknown";
    }
}

// ============================================================================
// Absorption
// ============================================================================

enum class absorption_strategy_type { normal, gradual, selective, emergency };

constexpr const char* to_string(absorption_strategy_type type) noexcept {
    switch (type) {
        case absorption_strategy_type::normal: return "normal";
        case absorption_strategy_type::gradual: return "gradual";
        case absorption_strategy_type::selective: return "selective";
        case absorption_strategy_type::emergency: return "emergency";
        default: return "unknown";
    }
}

/**
 * @struct absorption_strategy
 * @brief How much incoming variety is accepted versus filtered
 */
struct absorption_strategy {
    absorption_strategy_type type{absorption_strategy_type::normal};
    std::string name;
    double capacity_multiplier{1.0};
    double acceptance{0.3};   ///< Fraction of absorbable variety accepted
};

struct absorption_outcome {
    absorption_strategy_type strategy{absorption_strategy_type::normal};
    bool capacity_exceeded{false};
    double absorbed{0.0};
};

/**
 * @struct risk_report
 * @brief Reply of monitor_variety
 */
struct risk_report {
    double external_variety{0.0};
    double internal_capacity{1.0};
    double variety_ratio{0.0};
    double explosion_risk{0.0};
    recommended_action action{recommended_action::monitor};
    double absorption_capability{0.0};
    std::optional<absorption_outcome> absorption;   ///< Set when remediation ran
};

// ============================================================================
// Emergency protocols
// ============================================================================

enum class protocol_kind {
    none,
    meta_spawn,
    cascade_prevention,
    emergency_filter,
    controlled_degradation
};

constexpr const char* to_string(protocol_kind kind) noexcept {
    switch (kind) {
        case protocol_kind::none: return "none";
        case protocol_kind::meta_spawn: return "meta_spawn";
        case protocol_kind::cascade_prevention: return "cascade_prevention";
        case protocol_kind::emergency_filter: return "emergency_filter";
        case protocol_kind::controlled_degradation: return "controlled_degradation";
        default: return "unknown";
    }
}

/**
 * @struct emergency_protocol
 * @brief Named set of actions triggered at or above a risk threshold
 */
struct emergency_protocol {
    protocol_kind kind{protocol_kind::none};
    std::string name;
    double trigger_threshold{0.0};
    std::vector<std::string> actions;
};

struct protocol_action_result {
    std::string action;
    bool success{false};
    std::string detail;
};

struct protocol_result {
    protocol_kind protocol{protocol_kind::none};
    std::string protocol_name{"None"};
    std::vector<protocol_action_result> action_results;
    bool success{true};   ///< AND of every action result
};

/**
 * @struct intervention_state
 * @brief Local effects left in place by executed protocol actions
 */
struct intervention_state {
    bool filters_active{false};
    bool inputs_reduced{false};
    bool subsystems_isolated{false};
    bool dampeners_active{false};
    bool degraded_mode{false};
    bool core_preserved{false};
    uint64_t redistributions{0};
    uint64_t meta_system_requests{0};
};

/**
 * @struct explosion_event
 * @brief Append-only record of one explosion threat and the response to it
 */
struct explosion_event {
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    risk_report explosion_data;
    protocol_kind protocol_used{protocol_kind::none};
    protocol_result response_result;
    bool uncontrolled{false};
};

// ============================================================================
// Cascades
// ============================================================================

enum class system_impact { moderate, severe, critical, catastrophic };

constexpr const char* to_string(system_impact impact) noexcept {
    switch (impact) {
        case system_impact::moderate: return "moderate";
        case system_impact::severe: return "severe";
        case system_impact::critical: return "critical";
        case system_impact::catastrophic: return "catastrophic";
        default: return "unknown";
    }
}

enum class affected_system {
    system3_control,
    system1_operations,
    system2_coordination,
    system5_policy,
    total_system_failure
};

constexpr const char* to_string(affected_system system) noexcept {
    switch (system) {
        case affected_system::system3_control: return "system3_control";
        case affected_system::system1_operations: return "system1_operations";
        case affected_system::system2_coordination: return "system2_coordination";
        case affected_system::system5_policy: return "system5_policy";
        case affected_system::total_system_failure: return "total_system_failure";
        default: return "unknown";
    }
}

struct cascade_stage {
    int stage_number{0};
    std::string description;
    double variety_level{0.0};
    system_impact impact{system_impact::moderate};
    std::optional<std::chrono::milliseconds> duration;   ///< Empty when indefinite
};

struct cascade_prediction {
    double initial_variety{0.0};
    std::vector<cascade_stage> cascade_stages;
    std::vector<affected_system> affected_systems;
    double peak_variety{0.0};
    std::chrono::milliseconds duration{0};
    double containment_probability{0.0};
};

/**
 * @struct cascade_risk_report
 * @brief Sent to the policy authority when a cascade looks uncontainable
 */
struct cascade_risk_report {
    cascade_prediction prediction;
    std::string urgency{"high"};
    std::string recommended_action{"preemptive_meta_spawn"};
};

/**
 * @struct meta_system_spawn_request
 * @brief Request for a new control instance to absorb variety
 */
struct meta_system_spawn_request {
    std::string reason{"variety_explosion"};
    double variety_level{0.0};
    double variety_ratio{0.0};
    double explosion_risk{0.0};
    std::string urgency{"critical"};
    std::string meta_system_type{"variety_absorber"};
};

// ============================================================================
// Risk assessment and state
// ============================================================================

struct mitigation_option {
    std::string action;
    double effectiveness{0.0};
    std::string cost;
    std::string time_to_effect;
};

/**
 * @struct explosion_risk_assessment
 * @brief Reply of check_explosion_risk
 *
 * time_to_explosion is +infinity when variety is not increasing.
 */
struct explosion_risk_assessment {
    double current_risk{0.0};
    variety_trend trend{variety_trend::stable};
    double time_to_explosion_seconds{std::numeric_limits<double>::infinity()};
    double cascade_probability{0.0};
    std::vector<mitigation_option> mitigation_options;
};

struct variety_metrics {
    double peak_variety{0.0};
    double average_variety{0.0};
    uint64_t explosion_count{0};
    uint64_t cascade_events{0};
    double absorption_rate{0.7};
    double recovery_time_seconds{0.0};
};

/**
 * @struct variety_state
 * @brief Point-in-time snapshot of the variety monitor
 *
 * serialize() and deserialize() round-trip every field exactly; doubles are
 * written in hexadecimal floating-point form.
 */
struct variety_state {
    double current_variety_level{0.0};
    double internal_variety_capacity{1.0};
    double variety_ratio{0.0};
    size_t explosion_events{0};
    size_t cascade_predictions{0};
    variety_metrics metrics;
    bool monitoring_active{false};

    std::string serialize() const;

    static result<variety_state> deserialize(const std::string& text);

    bool operator==(const variety_state& other) const;
};

} // namespace kcenon::vsm
