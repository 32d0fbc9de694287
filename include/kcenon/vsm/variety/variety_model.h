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
 * @file variety_model.h
 * @brief Pure risk, absorption, protocol and cascade functions
 *
 * The variety monitor applies these to its state; they hold no state of
 * their own so that every threshold can be tested in isolation.
 */

#include <vector>

#include "variety_types.h"
#include "../scanner/signal_types.h"

namespace kcenon::vsm {

/**
 * @brief Weighted variety of an environment sample
 *
 * 0.3 per novel pattern, 0.2 per emergent property, 0.25 per recursive
 * potential and 0.25 per meta-system seed; x1.5 under superposition.
 */
double calculate_external_variety(const variety_data& data);

/**
 * @brief Trend over the last 10 samples, oldest first
 *
 * Fewer than 3 samples are stable. Increasing when the second-half mean
 * exceeds 1.1x the first-half mean, decreasing below 0.9x.
 */
variety_trend classify_trend(const std::vector<double>& history);

double trend_factor(variety_trend trend) noexcept;

/**
 * @brief Peak multiplier used by cascade prediction
 */
double peak_multiplier(variety_trend trend) noexcept;

/**
 * @brief min(1, (ratio / critical_ratio) * trend_factor * (2 - absorption_rate))
 */
double calculate_explosion_risk(double variety_ratio, variety_trend trend,
                                double absorption_rate, double critical_ratio = 3.0);

recommended_action recommend_action(double explosion_risk, double variety_ratio) noexcept;

/**
 * @brief absorption_rate * max(0.1, 1 - current / 10)
 */
double calculate_absorption_capability(double absorption_rate, double current_variety) noexcept;

/**
 * @brief Step function of the variety ratio
 *
 * >3 emergency, >2 selective, >1.5 gradual, else normal.
 */
absorption_strategy select_absorption_strategy(double variety_ratio);

/**
 * @brief Absorb @p variety within @p capability
 * @return capacity_exceeded when the variety is larger than the capability
 */
result<absorption_outcome> execute_absorption(const absorption_strategy& strategy,
                                              double variety, double capability);

/**
 * @brief ((ratio - threshold) / (1 - threshold))^2 capped at 1, 0 at or below threshold
 */
double calculate_cascade_probability(double variety_ratio, double cascade_threshold = 0.75);

/**
 * @brief Mitigations for the current load; meta-system spawning only above 2x capacity
 */
std::vector<mitigation_option> mitigation_options(double current_variety, double capacity);

/**
 * @brief meta_spawn 0.9, cascade_prevention 0.75, emergency_filter 0.7,
 *        controlled_degradation 0.6
 */
std::vector<emergency_protocol> default_emergency_protocols();

/**
 * @brief Protocol with the highest trigger threshold not above @p risk
 *
 * Returns a protocol of kind none, named "None", when nothing qualifies.
 */
emergency_protocol select_emergency_protocol(double risk,
                                             const std::vector<emergency_protocol>& protocols);

/**
 * @brief Stage-wise cascade simulation
 *
 * Stages fire while the amplified variety exceeds 1x, 1.5x, 2x and 3x
 * capacity. Affected systems escalate as variety crosses 1x to 5x capacity.
 */
cascade_prediction simulate_cascade(double initial_variety, double capacity,
                                    variety_trend trend, double absorption_capability);

} // namespace kcenon::vsm
