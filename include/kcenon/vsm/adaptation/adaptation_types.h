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
 * @file adaptation_types.h
 * @brief Challenges, proposals and active adaptations
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::vsm {

enum class challenge_type {
    health,
    efficiency,
    innovation,
    market_shift,
    technology_disruption,
    variety_explosion,
    pattern_emergence,
    general
};

constexpr const char* to_string(challenge_type type) noexcept {
    switch (type) {
        case challenge_type::health: return "health";
        case challenge_type::efficiency: return "efficiency";
        case challenge_type::innovation: return "innovation";
        case challenge_type::market_shift: return "market_shift";
        case challenge_type::technology_disruption: return "technology_disruption";
        case challenge_type::variety_explosion: return "variety_explosion";
        case challenge_type::pattern_emergence: return "pattern_emergence";
        case challenge_type::general: return "general";
        default: return "unknown";
    }
}

enum class challenge_urgency { low, medium, high };

constexpr const char* to_string(challenge_urgency urgency) noexcept {
    switch (urgency) {
        case challenge_urgency::low: return "low";
        case challenge_urgency::medium: return "medium";
        case challenge_urgency::high: return "high";
        default: return "unknown";
    }
}

struct challenge {
    challenge_type type{challenge_type::general};
    challenge_urgency urgency{challenge_urgency::medium};
    std::string scope{"operational"};
};

enum class adaptation_model_type { incremental, transformational, defensive };

constexpr const char* to_string(adaptation_model_type type) noexcept {
    switch (type) {
        case adaptation_model_type::incremental: return "incremental";
        case adaptation_model_type::transformational: return "transformational";
        case adaptation_model_type::defensive: return "defensive";
        default: return "unknown";
    }
}

struct resource_requirements {
    std::string time;
    std::string cost;
};

/**
 * @struct adaptation_proposal
 * @brief Response to a challenge generated by one adaptation model
 */
struct adaptation_proposal {
    std::string id;
    challenge source_challenge;
    adaptation_model_type model_type{adaptation_model_type::incremental};
    std::vector<std::string> actions;
    double impact{0.0};
    resource_requirements resources_required;
    std::string timeline;
    std::vector<std::string> risks;
    std::chrono::system_clock::time_point created_at{std::chrono::system_clock::now()};
};

enum class adaptation_status { in_progress, completed };

constexpr const char* to_string(adaptation_status status) noexcept {
    switch (status) {
        case adaptation_status::in_progress: return "in_progress";
        case adaptation_status::completed: return "completed";
        default: return "unknown";
    }
}

/**
 * @struct adaptation_progress
 * @brief Result of one monitoring tick
 */
struct adaptation_progress {
    bool completed{false};
    double progress{0.0};
    bool success{false};
    double efficiency_impact{0.0};
    double effectiveness_impact{0.0};

    /**
     * @brief Zero-progress result used when probing fails
     */
    static adaptation_progress safe_default() { return adaptation_progress{}; }
};

/**
 * @struct adaptation
 * @brief Proposal accepted for implementation
 */
struct adaptation {
    adaptation_proposal proposal;
    adaptation_status status{adaptation_status::in_progress};
    std::chrono::system_clock::time_point started_at{std::chrono::system_clock::now()};
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<adaptation_progress> results;
    bool resource_constrained{false};
    uint32_t polls{0};

    const std::string& id() const { return proposal.id; }
};

struct adaptation_metrics {
    double success_rate{0.9};
    double average_completion_time_seconds{0.0};
    double resource_efficiency{0.85};
    double innovation_index{0.7};
    size_t active_adaptations{0};
    double adaptation_capacity{0.9};
    uint64_t completed_adaptations{0};
};

/**
 * @struct viability_metrics
 * @brief Aggregate viability indicators; absent values raise no challenge
 */
struct viability_metrics {
    std::optional<double> system_health;
    std::optional<double> resource_efficiency;
    std::optional<double> innovation_lag;
};

} // namespace kcenon::vsm
