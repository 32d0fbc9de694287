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

#include "kcenon/vsm/variety/variety_model.h"
#include "kcenon/vsm/utils/statistics.h"

#include <algorithm>
#include <cmath>

namespace kcenon::vsm {

double calculate_external_variety(const variety_data& data) {
    const double base = static_cast<double>(data.novel_patterns.size()) * 0.3 +
                        static_cast<double>(data.emergent_properties.size()) * 0.2 +
                        static_cast<double>(data.recursive_potential.size()) * 0.25 +
                        static_cast<double>(data.meta_system_seeds.size()) * 0.25;
    return data.quantum_superposition ? base * 1.5 : base;
}

variety_trend classify_trend(const std::vector<double>& history) {
    if (history.size() < 3) {
        return variety_trend::stable;
    }

    const auto recent = stats::tail(history, 10);
    const size_t half = recent.size() / 2;
    const std::vector<double> first(recent.begin(), recent.begin() + static_cast<std::ptrdiff_t>(half));
    const std::vector<double> second(recent.begin() + static_cast<std::ptrdiff_t>(half), recent.end());

    const double first_mean = stats::mean(first);
    const double second_mean = stats::mean(second);
    if (second_mean > first_mean * 1.1) {
        return variety_trend::increasing;
    }
    if (second_mean < first_mean * 0.9) {
        return variety_trend::decreasing;
    }
    return variety_trend::stable;
}

double trend_factor(variety_trend trend) noexcept {
    switch (trend) {
        case variety_trend::increasing: return 1.2;
        case variety_trend::decreasing: return 0.8;
        default: return 1.0;
    }
}

double peak_multiplier(variety_trend trend) noexcept {
    switch (trend) {
        case variety_trend::increasing: return 2.5;
        case variety_trend::decreasing: return 1.3;
        default: return 1.8;
    }
}

double calculate_explosion_risk(double variety_ratio, variety_trend trend,
                                double absorption_rate, double critical_ratio) {
    const double deficit = 1.0 - absorption_rate;
    return std::min(1.0, (variety_ratio / critical_ratio) * trend_factor(trend) * (1.0 + deficit));
}

recommended_action recommend_action(double explosion_risk, double variety_ratio) noexcept {
    if (explosion_risk > 0.9) {
        return recommended_action::immediate_meta_system_spawn;
    }
    if (explosion_risk > 0.7) {
        return recommended_action::emergency_absorption;
    }
    if (variety_ratio > 2.0) {
        return recommended_action::increase_internal_variety;
    }
    if (variety_ratio > 1.5) {
        return recommended_action::selective_filtering;
    }
    return recommended_action::monitor;
}

double calculate_absorption_capability(double absorption_rate, double current_variety) noexcept {
    return absorption_rate * std::max(0.1, 1.0 - current_variety / 10.0);
}

absorption_strategy select_absorption_strategy(double variety_ratio) {
    if (variety_ratio > 3.0) {
        return {absorption_strategy_type::emergency, "Emergency Absorption", 2.0, 1.0};
    }
    if (variety_ratio > 2.0) {
        return {absorption_strategy_type::selective, "Selective Absorption", 1.5, 0.7};
    }
    if (variety_ratio > 1.5) {
        return {absorption_strategy_type::gradual, "Gradual Absorption", 1.2, 0.5};
    }
    return {absorption_strategy_type::normal, "Normal Absorption", 1.0, 0.3};
}

result<absorption_outcome> execute_absorption(const absorption_strategy& strategy,
                                              double variety, double capability) {
    if (variety > capability) {
        return make_error<absorption_outcome>(vsm_error_code::capacity_exceeded,
                                              strategy.name + " cannot absorb variety " +
                                              std::to_string(variety));
    }

    absorption_outcome outcome;
    outcome.strategy = strategy.type;
    outcome.absorbed = std::min(variety, capability) * strategy.acceptance;
    return make_success(outcome);
}

double calculate_cascade_probability(double variety_ratio, double cascade_threshold) {
    if (variety_ratio <= cascade_threshold) {
        return 0.0;
    }
    const double scaled = (variety_ratio - cascade_threshold) / (1.0 - cascade_threshold);
    return std::min(1.0, scaled * scaled);
}

std::vector<mitigation_option> mitigation_options(double current_variety, double capacity) {
    std::vector<mitigation_option> options = {
        {"increase_internal_variety", 0.7, "medium", "immediate"},
        {"filter_external_variety", 0.5, "low", "immediate"}
    };
    if (current_variety > capacity * 2.0) {
        options.push_back({"spawn_meta_system", 0.9, "high", "delayed"});
    }
    return options;
}

std::vector<emergency_protocol> default_emergency_protocols() {
    return {
        {protocol_kind::meta_spawn, "Meta-System Spawn", 0.9,
         {"spawn_meta_system", "redistribute_variety"}},
        {protocol_kind::cascade_prevention, "Cascade Prevention", 0.75,
         {"isolate_subsystems", "activate_dampeners"}},
        {protocol_kind::emergency_filter, "Emergency Filter", 0.7,
         {"activate_filters", "reduce_inputs"}},
        {protocol_kind::controlled_degradation, "Controlled Degradation", 0.6,
         {"reduce_functionality", "preserve_core"}}
    };
}

emergency_protocol select_emergency_protocol(double risk,
                                             const std::vector<emergency_protocol>& protocols) {
    const emergency_protocol* selected = nullptr;
    for (const auto& protocol : protocols) {
        if (protocol.trigger_threshold <= risk &&
            (selected == nullptr || protocol.trigger_threshold > selected->trigger_threshold)) {
            selected = &protocol;
        }
    }
    if (selected == nullptr) {
        return emergency_protocol{protocol_kind::none, "None", 0.0, {}};
    }
    return *selected;
}

cascade_prediction simulate_cascade(double initial_variety, double capacity,
                                    variety_trend trend, double absorption_capability) {
    struct stage_rule {
        double threshold;
        double amplification;
        const char* description;
        system_impact impact;
        std::optional<std::chrono::milliseconds> duration;
    };
    static const stage_rule rules[] = {
        {1.0, 1.2, "Initial variety overload", system_impact::moderate, std::chrono::milliseconds(100)},
        {1.5, 1.3, "System stress and degradation", system_impact::severe, std::chrono::milliseconds(500)},
        {2.0, 1.5, "Cascade propagation to subsystems", system_impact::critical, std::chrono::milliseconds(1000)},
        {3.0, 1.0, "System collapse risk", system_impact::catastrophic, std::nullopt}
    };

    cascade_prediction prediction;
    prediction.initial_variety = initial_variety;

    double current = initial_variety;
    int stage_number = 0;
    for (const auto& rule : rules) {
        ++stage_number;
        if (current <= capacity * rule.threshold) {
            continue;
        }
        prediction.cascade_stages.push_back(
            cascade_stage{stage_number, rule.description, current, rule.impact, rule.duration});
        current *= rule.amplification;
    }

    const double relative = capacity > 0.0 ? initial_variety / capacity : 0.0;
    const affected_system escalation[] = {
        affected_system::system3_control, affected_system::system1_operations,
        affected_system::system2_coordination, affected_system::system5_policy,
        affected_system::total_system_failure
    };
    for (size_t i = 0; i < 5; ++i) {
        if (relative > static_cast<double>(i + 1)) {
            prediction.affected_systems.push_back(escalation[i]);
        }
    }

    prediction.peak_variety = initial_variety * peak_multiplier(trend);
    prediction.duration = std::chrono::milliseconds(std::llround(1000.0 * initial_variety));

    if (initial_variety <= absorption_capability) {
        prediction.containment_probability = 0.9;
    } else {
        const double ratio = absorption_capability / initial_variety;
        prediction.containment_probability = std::max(0.1, ratio * ratio);
    }
    return prediction;
}

} // namespace kcenon::vsm
