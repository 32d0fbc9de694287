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
 * @file test_adaptation_engine.cpp
 * @brief Proposal models, approval flow, progress polling and completion metrics
 */

#include <gtest/gtest.h>
#include <kcenon/vsm/adaptation/adaptation_engine.h>

#include "test_mocks.h"

#include <regex>
#include <thread>

using namespace kcenon::vsm;
using namespace kcenon::vsm::test_support;
using namespace std::chrono_literals;

// =========================================================================
// Models
// =========================================================================

TEST(AdaptationModelTest, UrgencySelectsModel) {
    EXPECT_EQ(select_model(challenge_urgency::high), adaptation_model_type::defensive);
    EXPECT_EQ(select_model(challenge_urgency::medium), adaptation_model_type::incremental);
    EXPECT_EQ(select_model(challenge_urgency::low), adaptation_model_type::transformational);
}

TEST(AdaptationModelTest, DefensiveHealthProposal) {
    auto proposal = build_proposal({challenge_type::health, challenge_urgency::high, "system_wide"});

    EXPECT_EQ(proposal.model_type, adaptation_model_type::defensive);
    EXPECT_EQ(proposal.actions, (std::vector<std::string>{
                                    "emergency_stabilization", "strengthen_core", "reduce_exposure"}));
    EXPECT_DOUBLE_EQ(proposal.impact, 0.35);
    EXPECT_EQ(proposal.timeline, "2_months");
    EXPECT_EQ(proposal.resources_required.time, "1_month");
    EXPECT_EQ(proposal.resources_required.cost, "medium");
    EXPECT_EQ(proposal.risks.size(), 2u);
    EXPECT_EQ(proposal.source_challenge.scope, "system_wide");
    EXPECT_TRUE(proposal.id.empty());
}

TEST(AdaptationModelTest, TransformationalMarketShiftPivots) {
    auto proposal = build_proposal({challenge_type::market_shift, challenge_urgency::low, "strategic"});
    EXPECT_EQ(proposal.model_type, adaptation_model_type::transformational);
    ASSERT_FALSE(proposal.actions.empty());
    EXPECT_EQ(proposal.actions.front(), "pivot_strategy");
    EXPECT_DOUBLE_EQ(proposal.impact, 0.7);
    EXPECT_EQ(proposal.timeline, "6_months");

    auto tech = build_proposal({challenge_type::technology_disruption, challenge_urgency::low, "strategic"});
    EXPECT_EQ(tech.actions.front(), "adopt_new_tech");
}

TEST(AdaptationModelTest, IncrementalEfficiencyStreamlines) {
    auto proposal = build_proposal({challenge_type::efficiency, challenge_urgency::medium, "operational"});
    EXPECT_EQ(proposal.model_type, adaptation_model_type::incremental);
    EXPECT_EQ(proposal.actions.size(), 3u);
    EXPECT_EQ(proposal.actions.front(), "streamline_operations");
    EXPECT_DOUBLE_EQ(proposal.impact, 0.25);

    auto general = build_proposal(challenge{});
    EXPECT_EQ(general.actions.size(), 2u);
    EXPECT_EQ(general.risks, std::vector<std::string>{"minimal_disruption"});
}

TEST(AdaptationModelTest, TimelineDurations) {
    EXPECT_EQ(estimate_duration("1_week"), std::chrono::hours(24 * 7));
    EXPECT_EQ(estimate_duration("2_weeks"), std::chrono::hours(24 * 14));
    EXPECT_EQ(estimate_duration("6_months"), std::chrono::hours(24 * 180));
    EXPECT_EQ(estimate_duration("90"), std::chrono::seconds(90));
    EXPECT_EQ(estimate_duration("0.4"), std::chrono::seconds(1));
}

TEST(AdaptationModelTest, UnknownTimelineFallsBackToThirtyDays) {
    const auto month = std::chrono::hours(24 * 30);
    EXPECT_EQ(estimate_duration(""), month);
    EXPECT_EQ(estimate_duration("soon"), month);
    EXPECT_EQ(estimate_duration("-5"), month);
    EXPECT_EQ(estimate_duration("12abc"), month);
}

TEST(ElapsedTimeProbeTest, ProgressFollowsElapsedTime) {
    elapsed_time_probe probe;
    adaptation active;
    active.proposal.timeline = "10";
    active.proposal.impact = 0.35;
    const auto now = std::chrono::system_clock::now();

    active.started_at = now - 5s;
    auto halfway = probe.probe(active, now);
    ASSERT_TRUE(halfway.is_ok());
    EXPECT_NEAR(halfway.value().progress, 0.5, 1e-9);
    EXPECT_FALSE(halfway.value().completed);
    EXPECT_FALSE(halfway.value().success);

    active.started_at = now - 9500ms;
    auto done = probe.probe(active, now);
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value().completed);
    EXPECT_TRUE(done.value().success);
    EXPECT_DOUBLE_EQ(done.value().efficiency_impact, 0.35);

    active.started_at = now + 5s;
    EXPECT_DOUBLE_EQ(probe.probe(active, now).value().progress, 0.0);
}

// =========================================================================
// Engine
// =========================================================================

class AdaptationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_ = std::make_shared<mock_policy_authority>();
        resources_ = std::make_shared<mock_resource_authority>();
        probe_ = std::make_shared<scripted_probe>();
        logger_ = std::make_shared<mock_logger>();
        observer_ = std::make_shared<recording_observer>();
        engine_ = std::make_unique<adaptation_engine>(config_, policy_, resources_, probe_, logger_);
        ASSERT_TRUE(engine_->register_observer(observer_).is_ok());
    }

    adaptation_proposal implement(challenge_urgency urgency = challenge_urgency::medium) {
        auto proposal = engine_->generate_proposal({challenge_type::general, urgency, "operational"});
        engine_->implement_adaptation(proposal);
        return proposal;
    }

    adaptation_engine_config config_;
    std::shared_ptr<mock_policy_authority> policy_;
    std::shared_ptr<mock_resource_authority> resources_;
    std::shared_ptr<scripted_probe> probe_;
    std::shared_ptr<mock_logger> logger_;
    std::shared_ptr<recording_observer> observer_;
    std::unique_ptr<adaptation_engine> engine_;
};

TEST_F(AdaptationEngineTest, ProposalIdsAreUniqueAndTimestamped) {
    auto first = engine_->generate_proposal(challenge{});
    auto second = engine_->generate_proposal(challenge{});

    const std::regex format("ADAPT-[0-9]+-[0-9]+");
    EXPECT_TRUE(std::regex_match(first.id, format)) << first.id;
    EXPECT_TRUE(std::regex_match(second.id, format)) << second.id;
    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(first.id.substr(first.id.rfind('-')), "-1");
    EXPECT_EQ(second.id.substr(second.id.rfind('-')), "-2");
}

TEST_F(AdaptationEngineTest, AdaptationNeededIsSubmittedForApproval) {
    challenge c{challenge_type::variety_explosion, challenge_urgency::high, "system_wide"};
    ASSERT_TRUE(engine_->handle_adaptation_needed(c).is_ok());

    ASSERT_EQ(policy_->approval_count(), 1u);
    EXPECT_EQ(policy_->approvals[0].model_type, adaptation_model_type::defensive);
    EXPECT_EQ(policy_->approvals[0].source_challenge.type, challenge_type::variety_explosion);
}

TEST_F(AdaptationEngineTest, RejectedSubmissionIsReported) {
    policy_->reject_submissions = true;
    auto submitted = engine_->handle_adaptation_needed(challenge{});
    ASSERT_TRUE(submitted.is_err());
    EXPECT_EQ(error_code_of(submitted), vsm_error_code::operation_failed);
    EXPECT_TRUE(logger_->contains("approval submission"));
}

TEST_F(AdaptationEngineTest, SubmissionWithoutPolicyFails) {
    adaptation_engine engine(config_, nullptr, nullptr, probe_, logger_);
    auto submitted = engine.handle_adaptation_needed(challenge{});
    EXPECT_EQ(error_code_of(submitted), vsm_error_code::invalid_state);
    EXPECT_GE(logger_->count_at(log_level::warning), 1u);
}

TEST_F(AdaptationEngineTest, ImplementationTracksAndAllocates) {
    auto proposal = implement();

    auto active = engine_->get_active_adaptations();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].id(), proposal.id);
    EXPECT_EQ(active[0].status, adaptation_status::in_progress);
    EXPECT_FALSE(active[0].resource_constrained);
    EXPECT_EQ(resources_->allocations, std::vector<std::string>{proposal.id});
    EXPECT_EQ(observer_->count(intelligence_event_kind::adaptation_started), 1u);
}

TEST_F(AdaptationEngineTest, DuplicateProposalIsIgnored) {
    auto proposal = implement();
    engine_->implement_adaptation(proposal);

    EXPECT_EQ(engine_->get_active_adaptations().size(), 1u);
    EXPECT_EQ(resources_->allocations.size(), 1u);
    EXPECT_TRUE(logger_->contains("already active"));
}

TEST_F(AdaptationEngineTest, DeniedResourcesStillStartConstrained) {
    resources_->deny_allocations = true;
    implement();

    auto active = engine_->get_active_adaptations();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_TRUE(active[0].resource_constrained);
    EXPECT_EQ(observer_->count(intelligence_event_kind::resource_constrained), 1u);
    EXPECT_EQ(observer_->count(intelligence_event_kind::adaptation_started), 1u);
}

TEST_F(AdaptationEngineTest, SuccessfulCompletionUpdatesMetrics) {
    auto proposal = implement();
    probe_->push(0.5, false);
    probe_->push(1.0, true, true, 0.4);

    auto halfway = engine_->poll_adaptation(proposal.id);
    ASSERT_TRUE(halfway.is_ok());
    EXPECT_DOUBLE_EQ(halfway.value().progress, 0.5);
    EXPECT_EQ(engine_->get_active_adaptations().size(), 1u);
    EXPECT_EQ(engine_->get_active_adaptations()[0].polls, 1u);

    auto done = engine_->poll_adaptation(proposal.id);
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value().completed);
    EXPECT_TRUE(engine_->get_active_adaptations().empty());

    auto history = engine_->get_adaptation_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, adaptation_status::completed);
    ASSERT_TRUE(history[0].completed_at.has_value());
    ASSERT_TRUE(history[0].results.has_value());
    EXPECT_EQ(history[0].polls, 2u);

    auto metrics = engine_->get_adaptation_metrics();
    EXPECT_NEAR(metrics.success_rate, 0.905, 1e-12);
    EXPECT_NEAR(metrics.resource_efficiency, 0.89, 1e-12);
    EXPECT_EQ(metrics.completed_adaptations, 1u);
    EXPECT_GE(metrics.average_completion_time_seconds, 0.0);
    EXPECT_EQ(observer_->count(intelligence_event_kind::adaptation_completed), 1u);

    EXPECT_EQ(error_code_of(engine_->poll_adaptation(proposal.id)), vsm_error_code::not_found);
}

TEST_F(AdaptationEngineTest, FailedCompletionLowersSuccessRate) {
    auto proposal = implement();
    probe_->push(1.0, true, false);
    ASSERT_TRUE(engine_->poll_adaptation(proposal.id).is_ok());

    auto metrics = engine_->get_adaptation_metrics();
    EXPECT_NEAR(metrics.success_rate, 0.855, 1e-12);
    EXPECT_DOUBLE_EQ(metrics.resource_efficiency, 0.85);
    EXPECT_TRUE(logger_->contains("failed"));
}

TEST_F(AdaptationEngineTest, EarlyCompletionClaimIsIgnored) {
    auto proposal = implement();
    probe_->push(0.1, true);
    probe_->push(0.95, true);

    auto early = engine_->poll_adaptation(proposal.id);
    ASSERT_TRUE(early.is_ok());
    EXPECT_FALSE(early.value().completed);
    EXPECT_EQ(engine_->get_active_adaptations().size(), 1u);
    EXPECT_TRUE(engine_->get_adaptation_history().empty());
    EXPECT_TRUE(logger_->contains("still in progress"));

    auto done = engine_->poll_adaptation(proposal.id);
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value().completed);
    EXPECT_TRUE(engine_->get_active_adaptations().empty());
    EXPECT_EQ(engine_->get_adaptation_history().size(), 1u);
}

TEST_F(AdaptationEngineTest, NonStandardProbeExceptionIsContained) {
    auto proposal = implement();
    probe_->failure = scripted_probe::mode::foreign_exception;

    auto reading = engine_->poll_adaptation(proposal.id);
    ASSERT_TRUE(reading.is_ok());
    EXPECT_DOUBLE_EQ(reading.value().progress, 0.0);
    EXPECT_FALSE(reading.value().completed);
    EXPECT_EQ(engine_->get_active_adaptations().size(), 1u);
    EXPECT_EQ(observer_->count(intelligence_event_kind::progress_fault), 1u);
    EXPECT_TRUE(logger_->contains("unknown exception"));
}

TEST_F(AdaptationEngineTest, ProbeErrorReadsAsNoProgress) {
    auto proposal = implement();
    probe_->failure = scripted_probe::mode::error;

    auto reading = engine_->poll_adaptation(proposal.id);
    ASSERT_TRUE(reading.is_ok());
    EXPECT_DOUBLE_EQ(reading.value().progress, 0.0);
    EXPECT_FALSE(reading.value().completed);
    EXPECT_EQ(engine_->get_active_adaptations().size(), 1u);
    EXPECT_EQ(observer_->count(intelligence_event_kind::progress_fault), 1u);
    EXPECT_TRUE(logger_->contains("probe offline"));
}

TEST_F(AdaptationEngineTest, ProbeExceptionIsContained) {
    auto proposal = implement();
    probe_->failure = scripted_probe::mode::exception;

    auto reading = engine_->poll_adaptation(proposal.id);
    ASSERT_TRUE(reading.is_ok());
    EXPECT_FALSE(reading.value().completed);
    EXPECT_EQ(observer_->count(intelligence_event_kind::progress_fault), 1u);
    EXPECT_TRUE(logger_->contains("probe crashed"));
}

TEST_F(AdaptationEngineTest, UnknownAdaptationCannotBePolled) {
    EXPECT_EQ(error_code_of(engine_->poll_adaptation("ADAPT-0-0")), vsm_error_code::not_found);
}

TEST_F(AdaptationEngineTest, CapacityShrinksWithActiveAdaptations) {
    EXPECT_DOUBLE_EQ(engine_->get_adaptation_metrics().adaptation_capacity, 0.9);

    for (int i = 0; i < 3; ++i) {
        implement();
    }
    auto metrics = engine_->get_adaptation_metrics();
    EXPECT_EQ(metrics.active_adaptations, 3u);
    EXPECT_DOUBLE_EQ(metrics.adaptation_capacity, 0.5);

    for (int i = 0; i < 2; ++i) {
        implement();
    }
    EXPECT_DOUBLE_EQ(engine_->get_adaptation_metrics().adaptation_capacity, 0.2);
}

TEST_F(AdaptationEngineTest, HistoryIsBounded) {
    config_.history_limit = 2;
    engine_ = std::make_unique<adaptation_engine>(config_, policy_, resources_, probe_, logger_);

    for (int i = 0; i < 3; ++i) {
        auto proposal = implement();
        probe_->push(1.0, true);
        ASSERT_TRUE(engine_->poll_adaptation(proposal.id).is_ok());
    }
    EXPECT_EQ(engine_->get_adaptation_history().size(), 2u);
    EXPECT_EQ(engine_->get_adaptation_metrics().completed_adaptations, 3u);
}

// =========================================================================
// Viability Review
// =========================================================================

TEST_F(AdaptationEngineTest, ViabilityMetricsRaiseChallenges) {
    viability_metrics metrics;
    metrics.system_health = 0.5;
    metrics.resource_efficiency = 0.4;
    metrics.innovation_lag = 0.9;
    engine_->request_proposals_for_viability(metrics);

    ASSERT_EQ(policy_->approval_count(), 3u);
    EXPECT_EQ(policy_->approvals[0].model_type, adaptation_model_type::defensive);
    EXPECT_EQ(policy_->approvals[0].actions.front(), "emergency_stabilization");
    EXPECT_EQ(policy_->approvals[1].model_type, adaptation_model_type::incremental);
    EXPECT_EQ(policy_->approvals[2].model_type, adaptation_model_type::transformational);
}

TEST_F(AdaptationEngineTest, HealthyViabilityRaisesNothing) {
    viability_metrics metrics;
    metrics.system_health = 0.9;
    metrics.innovation_lag = 0.2;
    engine_->request_proposals_for_viability(metrics);
    EXPECT_EQ(policy_->approval_count(), 0u);

    engine_->request_proposals_for_viability(viability_metrics{});
    EXPECT_EQ(policy_->approval_count(), 0u);
}

TEST_F(AdaptationEngineTest, RejectedChallengeDoesNotBlockOthers) {
    policy_->reject_submissions = true;
    viability_metrics metrics;
    metrics.system_health = 0.5;
    metrics.resource_efficiency = 0.4;
    engine_->request_proposals_for_viability(metrics);
    EXPECT_EQ(policy_->approval_count(), 2u);
    EXPECT_TRUE(logger_->contains("raised 2 challenges, 2 submissions failed"));
}

// =========================================================================
// Periodic Polling
// =========================================================================

TEST_F(AdaptationEngineTest, StartedEnginePollsUntilCompletion) {
    config_.monitor_interval = 10ms;
    engine_ = std::make_unique<adaptation_engine>(config_, policy_, resources_, probe_, logger_);
    ASSERT_TRUE(engine_->start().is_ok());

    probe_->push(0.3, false);
    probe_->push(0.6, false);
    probe_->push(1.0, true);
    implement();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (engine_->get_adaptation_history().empty() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    auto history = engine_->get_adaptation_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].polls, 3u);
    EXPECT_TRUE(engine_->get_active_adaptations().empty());
    ASSERT_TRUE(engine_->stop().is_ok());
}

TEST_F(AdaptationEngineTest, InvalidConfigurationBlocksStart) {
    config_.monitor_interval = 0ms;
    adaptation_engine engine(config_);
    EXPECT_EQ(error_code_of(engine.start()), vsm_error_code::invalid_configuration);
}
