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
 * @file thread_safety_tests.cpp
 * @brief Concurrent callers against started intelligence units
 */

#include <gtest/gtest.h>
#include <kcenon/vsm/intelligence_coordinator.h>

#include "test_mocks.h"

#include <atomic>
#include <chrono>
#include <latch>
#include <set>
#include <thread>
#include <vector>

using namespace kcenon::vsm;
using namespace kcenon::vsm::test_support;
using namespace std::chrono_literals;

class IntelligenceThreadSafetyTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_ = std::make_shared<mock_policy_authority>();
        resources_ = std::make_shared<mock_resource_authority>();
    }

    std::shared_ptr<mock_policy_authority> policy_;
    std::shared_ptr<mock_resource_authority> resources_;
};

// Test 1: Concurrent variety samples are all accounted for
TEST_F(IntelligenceThreadSafetyTest, ConcurrentVarietySamples) {
    variety_monitor monitor(variety_monitor_config{}, policy_, resources_);
    ASSERT_TRUE(monitor.start().is_ok());

    const int num_callers = 8;
    const int samples_per_caller = 100;
    std::latch sync_point(num_callers);
    std::atomic<int> explosive{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_callers; ++t) {
        threads.emplace_back([&, t]() {
            sync_point.arrive_and_wait();
            for (int i = 0; i < samples_per_caller; ++i) {
                variety_data data;
                const int novel = (t + i) % 12;
                for (int n = 0; n < novel; ++n) {
                    data.novel_patterns.push_back("n" + std::to_string(n));
                }
                auto report = monitor.monitor_variety(data);
                if (report.absorption.has_value()) {
                    ++explosive;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto state = monitor.get_variety_state();
    EXPECT_EQ(state.metrics.explosion_count, static_cast<uint64_t>(explosive.load()));
    EXPECT_EQ(monitor.get_explosion_events().size(),
              std::min<size_t>(static_cast<size_t>(explosive.load()), 100u));
    ASSERT_TRUE(monitor.stop().is_ok());
}

// Test 2: Concurrent detection keeps pattern ids unique
TEST_F(IntelligenceThreadSafetyTest, ConcurrentDetection) {
    pattern_detector detector(pattern_detector_config{}, policy_);
    ASSERT_TRUE(detector.start().is_ok());

    const int num_callers = 6;
    const int calls_per_caller = 20;
    std::latch sync_point(num_callers);
    std::atomic<size_t> produced{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_callers; ++t) {
        threads.emplace_back([&, t]() {
            std::vector<double> stream;
            for (int i = 0; i < 30; ++i) {
                stream.push_back(static_cast<double>((i * (t + 1)) % 7));
            }
            sync_point.arrive_and_wait();
            for (int i = 0; i < calls_per_caller; ++i) {
                produced += detector.detect_patterns(stream).patterns.size();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto patterns = detector.get_patterns();
    EXPECT_EQ(patterns.size(), produced.load());

    std::set<std::string> ids;
    for (const auto& p : patterns) {
        ids.insert(p.id);
    }
    EXPECT_EQ(ids.size(), patterns.size());
    ASSERT_TRUE(detector.stop().is_ok());
}

// Test 3: Implementations and polls from many threads
TEST_F(IntelligenceThreadSafetyTest, ConcurrentAdaptations) {
    auto probe = std::make_shared<scripted_probe>();
    adaptation_engine engine(adaptation_engine_config{}, policy_, resources_, probe);
    ASSERT_TRUE(engine.start().is_ok());

    const int num_callers = 4;
    const int adaptations_per_caller = 25;
    std::latch sync_point(num_callers);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_callers; ++t) {
        threads.emplace_back([&]() {
            sync_point.arrive_and_wait();
            for (int i = 0; i < adaptations_per_caller; ++i) {
                auto proposal = engine.generate_proposal(challenge{});
                engine.implement_adaptation(proposal);
                auto reading = engine.poll_adaptation(proposal.id);
                EXPECT_TRUE(reading.is_ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto metrics = engine.get_adaptation_metrics();
    EXPECT_EQ(metrics.active_adaptations, static_cast<size_t>(num_callers * adaptations_per_caller));
    EXPECT_DOUBLE_EQ(metrics.adaptation_capacity, 0.2);
    ASSERT_TRUE(engine.stop().is_ok());
}

// Test 4: Cycles racing with lifecycle calls
TEST_F(IntelligenceThreadSafetyTest, CyclesDuringStartStop) {
    intelligence_config config;
    config.scanner.scan_interval = 5ms;
    config.pattern.analysis_interval = 5ms;
    intelligence_coordinator intelligence(config, policy_, resources_);

    std::atomic<bool> running{true};
    std::thread cycler([&]() {
        while (running) {
            auto cycle = intelligence.run_intelligence_cycle(scan_scope::partial);
            EXPECT_TRUE(cycle.snapshot.source_available);
        }
    });

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(intelligence.start().is_ok());
        std::this_thread::sleep_for(10ms);
        EXPECT_TRUE(intelligence.stop().is_ok());
    }
    running = false;
    cycler.join();
    EXPECT_FALSE(intelligence.is_running());
}
