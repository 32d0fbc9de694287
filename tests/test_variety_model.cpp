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

/**
 * @file test_variety_model.cpp
 * @brief Risk, absorption, protocol and cascade functions
 */

#include <gtest/gtest.h>
#include <kcenon/vsm/variety/variety_model.h>

#include <vector>

using namespace kcenon::vsm;

class VarietyModelTest : public ::testing::Test {};

// =========================================================================
// External Variety and Trend
// =========================================================================

TEST_F(VarietyModelTest, WeightedExternalVariety) {
    variety_data data;
    data.novel_patterns = {"n"};
    data.emergent_properties = {"e"};
    data.recursive_potential = {"r"};
    data.meta_system_seeds = {"m"};
    EXPECT_DOUBLE_EQ(calculate_external_variety(data), 1.0);

    data.quantum_superposition = true;
    EXPECT_DOUBLE_EQ(calculate_external_variety(data), 1.5);

    EXPECT_DOUBLE_EQ(calculate_external_variety(variety_data{}), 0.0);
}

TEST_F(VarietyModelTest, TrendNeedsThreeSamples) {
    EXPECT_EQ(classify_trend({}), variety_trend::stable);
    EXPECT_EQ(classify_trend({1.0, 5.0}), variety_trend::stable);
}

TEST_F(VarietyModelTest, TrendComparesHalves) {
    EXPECT_EQ(classify_trend({1.0, 1.0, 1.0, 2.0, 2.0, 2.0}), variety_trend::increasing);
    EXPECT_EQ(classify_trend({2.0, 2.0, 2.0, 1.0, 1.0, 1.0}), variety_trend::decreasing);
    EXPECT_EQ(classify_trend({1.0, 1.05, 1.0, 1.05}), variety_trend::stable);
}

TEST_F(VarietyModelTest, TrendUsesLastTenSamples) {
    std::vector<double> history(20, 5.0);
    for (size_t i = 15; i < 20; ++i) {
        history[i] = 10.0;
    }
    EXPECT_EQ(classify_trend(history), variety_trend::increasing);
}

// =========================================================================
// Risk and Recommendation
// =========================================================================

TEST_F(VarietyModelTest, RiskFormulaAndCap) {
    EXPECT_NEAR(calculate_explosion_risk(1.5, variety_trend::stable, 0.7), 0.65, 1e-12);
    EXPECT_NEAR(calculate_explosion_risk(1.5, variety_trend::increasing, 0.7), 0.78, 1e-12);
    EXPECT_NEAR(calculate_explosion_risk(1.5, variety_trend::decreasing, 1.0), 0.4, 1e-12);
    EXPECT_DOUBLE_EQ(calculate_explosion_risk(2.5, variety_trend::stable, 0.7), 1.0);
}

TEST_F(VarietyModelTest, RiskIsMonotonicInRatio) {
    double previous = -1.0;
    for (double ratio = 0.0; ratio <= 5.0; ratio += 0.25) {
        const double risk = calculate_explosion_risk(ratio, variety_trend::stable, 0.7);
        EXPECT_GE(risk, previous);
        EXPECT_LE(risk, 1.0);
        previous = risk;
    }
}

TEST_F(VarietyModelTest, ActionTable) {
    EXPECT_EQ(recommend_action(0.95, 0.5), recommended_action::immediate_meta_system_spawn);
    EXPECT_EQ(recommend_action(0.8, 0.5), recommended_action::emergency_absorption);
    EXPECT_EQ(recommend_action(0.5, 2.5), recommended_action::increase_internal_variety);
    EXPECT_EQ(recommend_action(0.5, 1.7), recommended_action::selective_filtering);
    EXPECT_EQ(recommend_action(0.5, 1.5), recommended_action::monitor);
    EXPECT_EQ(recommend_action(0.9, 3.0), recommended_action::emergency_absorption);
}

// =========================================================================
// Absorption
// =========================================================================

TEST_F(VarietyModelTest, AbsorptionCapabilityFloor) {
    EXPECT_NEAR(calculate_absorption_capability(0.7, 2.5), 0.525, 1e-12);
    EXPECT_NEAR(calculate_absorption_capability(0.7, 20.0), 0.07, 1e-12);
}

TEST_F(VarietyModelTest, StrategyStepFunction) {
    EXPECT_EQ(select_absorption_strategy(3.5).type, absorption_strategy_type::emergency);
    EXPECT_EQ(select_absorption_strategy(3.0).type, absorption_strategy_type::selective);
    EXPECT_EQ(select_absorption_strategy(2.5).type, absorption_strategy_type::selective);
    EXPECT_EQ(select_absorption_strategy(1.7).type, absorption_strategy_type::gradual);
    EXPECT_EQ(select_absorption_strategy(1.0).type, absorption_strategy_type::normal);
    EXPECT_EQ(select_absorption_strategy(1.0).name, "Normal Absorption");
}

TEST_F(VarietyModelTest, AbsorptionWithinCapability) {
    auto outcome = execute_absorption(select_absorption_strategy(2.5), 0.4, 0.5);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().strategy, absorption_strategy_type::selective);
    EXPECT_FALSE(outcome.value().capacity_exceeded);
    EXPECT_NEAR(outcome.value().absorbed, 0.28, 1e-12);
}

TEST_F(VarietyModelTest, AbsorptionBeyondCapabilityFails) {
    auto outcome = execute_absorption(select_absorption_strategy(2.5), 2.5, 0.525);
    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(error_code_of(outcome), vsm_error_code::capacity_exceeded);
}

// =========================================================================
// Protocols
// =========================================================================

TEST_F(VarietyModelTest, ProtocolWithHighestQualifyingThreshold) {
    const auto protocols = default_emergency_protocols();
    ASSERT_EQ(protocols.size(), 4u);

    EXPECT_EQ(select_emergency_protocol(0.95, protocols).kind, protocol_kind::meta_spawn);
    EXPECT_EQ(select_emergency_protocol(0.9, protocols).kind, protocol_kind::meta_spawn);
    EXPECT_EQ(select_emergency_protocol(0.8, protocols).kind, protocol_kind::cascade_prevention);
    EXPECT_EQ(select_emergency_protocol(0.72, protocols).kind, protocol_kind::emergency_filter);
    EXPECT_EQ(select_emergency_protocol(0.65, protocols).kind,
              protocol_kind::controlled_degradation);
}

TEST_F(VarietyModelTest, NoProtocolBelowLowestThreshold) {
    auto none = select_emergency_protocol(0.5, default_emergency_protocols());
    EXPECT_EQ(none.kind, protocol_kind::none);
    EXPECT_EQ(none.name, "None");
    EXPECT_TRUE(none.actions.empty());

    EXPECT_EQ(select_emergency_protocol(1.0, {}).kind, protocol_kind::none);
}

TEST_F(VarietyModelTest, MetaSpawnMitigationOnlyAboveDoubleCapacity) {
    EXPECT_EQ(mitigation_options(1.5, 1.0).size(), 2u);

    auto options = mitigation_options(3.0, 1.0);
    ASSERT_EQ(options.size(), 3u);
    EXPECT_EQ(options.back().action, "spawn_meta_system");
    EXPECT_EQ(options.back().time_to_effect, "delayed");
}

// =========================================================================
// Cascades
// =========================================================================

TEST_F(VarietyModelTest, CascadeProbability) {
    EXPECT_DOUBLE_EQ(calculate_cascade_probability(0.75), 0.0);
    EXPECT_DOUBLE_EQ(calculate_cascade_probability(0.5), 0.0);
    EXPECT_NEAR(calculate_cascade_probability(0.875), 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(calculate_cascade_probability(1.0), 1.0);
    EXPECT_DOUBLE_EQ(calculate_cascade_probability(4.0), 1.0);
}

TEST_F(VarietyModelTest, CascadeAtFiveTimesCapacity) {
    auto prediction = simulate_cascade(5.0, 1.0, variety_trend::stable, 0.525);

    ASSERT_EQ(prediction.cascade_stages.size(), 4u);
    EXPECT_DOUBLE_EQ(prediction.cascade_stages[0].variety_level, 5.0);
    EXPECT_NEAR(prediction.cascade_stages[1].variety_level, 6.0, 1e-12);
    EXPECT_NEAR(prediction.cascade_stages[2].variety_level, 7.8, 1e-12);
    EXPECT_NEAR(prediction.cascade_stages[3].variety_level, 11.7, 1e-12);
    EXPECT_EQ(prediction.cascade_stages[3].impact, system_impact::catastrophic);
    EXPECT_FALSE(prediction.cascade_stages[3].duration.has_value());
    EXPECT_EQ(prediction.cascade_stages[0].duration, std::chrono::milliseconds(100));

    ASSERT_EQ(prediction.affected_systems.size(), 4u);
    EXPECT_EQ(prediction.affected_systems[0], affected_system::system3_control);
    EXPECT_EQ(prediction.affected_systems[3], affected_system::system5_policy);

    EXPECT_DOUBLE_EQ(prediction.peak_variety, 9.0);
    EXPECT_EQ(prediction.duration, std::chrono::milliseconds(5000));
    EXPECT_DOUBLE_EQ(prediction.containment_probability, 0.1);
}

TEST_F(VarietyModelTest, ContainedCascade) {
    auto prediction = simulate_cascade(0.5, 1.0, variety_trend::increasing, 0.6);
    EXPECT_TRUE(prediction.cascade_stages.empty());
    EXPECT_TRUE(prediction.affected_systems.empty());
    EXPECT_DOUBLE_EQ(prediction.peak_variety, 1.25);
    EXPECT_DOUBLE_EQ(prediction.containment_probability, 0.9);
}

TEST_F(VarietyModelTest, PartialContainment) {
    auto prediction = simulate_cascade(1.2, 1.0, variety_trend::decreasing, 0.6);
    ASSERT_EQ(prediction.cascade_stages.size(), 1u);
    EXPECT_EQ(prediction.cascade_stages[0].description, "Initial variety overload");
    ASSERT_EQ(prediction.affected_systems.size(), 1u);
    EXPECT_NEAR(prediction.containment_probability, 0.25, 1e-12);
}
