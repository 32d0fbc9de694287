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
 * @file test_service_unit.cpp
 * @brief Lifecycle, request, notification and timer behaviour of service_unit
 */

#include <gtest/gtest.h>
#include <kcenon/vsm/core/service_unit.h>

#include "test_mocks.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace kcenon::vsm;
using namespace kcenon::vsm::test_support;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Counter unit exposing the protected messaging primitives
 */
class counter_unit : public service_unit {
public:
    explicit counter_unit(logger_ptr logger = nullptr, bool valid = true)
        : service_unit("counter_unit", std::move(logger)), valid_(valid) {}

    ~counter_unit() override { stop(); }

    int increment() {
        return request([this]() { return ++count_; });
    }

    int nested_increment() {
        return request([this]() { return increment() + 100; });
    }

    void increment_later() {
        notify([this]() { ++count_; });
    }

    void increment_after(std::chrono::milliseconds delay) {
        schedule_after(delay, [this]() { ++count_; });
    }

    void throw_later() {
        notify([]() { throw std::runtime_error("boom"); });
    }

    void throw_int_after(std::chrono::milliseconds delay) {
        schedule_after(delay, []() { throw 42; });
    }

    bool request_on_worker() {
        return request([this]() { return on_worker_thread(); });
    }

    int count() const {
        return request([this]() { return count_; });
    }

    void emit(const std::string& message) {
        publish(intelligence_event_kind::scan_completed, message, 1.0);
    }

protected:
    result_void validate_start() override {
        if (!valid_) {
            return make_void_error(vsm_error_code::invalid_configuration, "bad config");
        }
        return make_void_success();
    }

private:
    bool valid_;
    int count_{0};
};

template <typename Predicate>
bool wait_for(Predicate predicate, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

} // namespace

class ServiceUnitTest : public ::testing::Test {
protected:
    void SetUp() override { logger_ = std::make_shared<mock_logger>(); }

    std::shared_ptr<mock_logger> logger_;
};

TEST_F(ServiceUnitTest, StartAndStop) {
    counter_unit unit(logger_);
    EXPECT_FALSE(unit.is_running());

    ASSERT_TRUE(unit.start().is_ok());
    EXPECT_TRUE(unit.is_running());

    auto again = unit.start();
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(error_code_of(again), vsm_error_code::already_started);

    ASSERT_TRUE(unit.stop().is_ok());
    EXPECT_FALSE(unit.is_running());
}

TEST_F(ServiceUnitTest, InvalidConfigurationBlocksStart) {
    counter_unit unit(logger_, false);
    auto result = unit.start();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(error_code_of(result), vsm_error_code::invalid_configuration);
    EXPECT_FALSE(unit.is_running());
}

TEST_F(ServiceUnitTest, RequestsRunInlineWhenStopped) {
    counter_unit unit;
    EXPECT_EQ(unit.increment(), 1);
    unit.increment_later();
    EXPECT_EQ(unit.count(), 2);
    EXPECT_FALSE(unit.request_on_worker());
}

TEST_F(ServiceUnitTest, RequestsRunOnWorkerWhenStarted) {
    counter_unit unit;
    ASSERT_TRUE(unit.start().is_ok());

    EXPECT_TRUE(unit.request_on_worker());
    EXPECT_EQ(unit.increment(), 1);
    EXPECT_EQ(unit.nested_increment(), 102);
}

TEST_F(ServiceUnitTest, ConcurrentRequestsAreSerialized) {
    counter_unit unit;
    ASSERT_TRUE(unit.start().is_ok());

    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&unit]() {
            for (int i = 0; i < 250; ++i) {
                unit.increment();
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    EXPECT_EQ(unit.count(), 1000);
}

TEST_F(ServiceUnitTest, NotificationsAreProcessedInOrder) {
    counter_unit unit;
    ASSERT_TRUE(unit.start().is_ok());

    for (int i = 0; i < 10; ++i) {
        unit.increment_later();
    }
    // A request queued after the notifications observes all of them.
    EXPECT_EQ(unit.count(), 10);
}

TEST_F(ServiceUnitTest, TimersFireAfterDelay) {
    counter_unit unit;
    ASSERT_TRUE(unit.start().is_ok());

    unit.increment_after(20ms);
    EXPECT_TRUE(wait_for([&unit]() { return unit.count() == 1; }));
}

TEST_F(ServiceUnitTest, TimersArmedWhileStoppedFireAfterStart) {
    counter_unit unit;
    unit.increment_after(1ms);
    std::this_thread::sleep_for(10ms);
    EXPECT_EQ(unit.count(), 0);

    ASSERT_TRUE(unit.start().is_ok());
    EXPECT_TRUE(wait_for([&unit]() { return unit.count() == 1; }));
}

TEST_F(ServiceUnitTest, StopDiscardsPendingTimers) {
    counter_unit unit;
    ASSERT_TRUE(unit.start().is_ok());
    unit.increment_after(10s);
    ASSERT_TRUE(unit.stop().is_ok());

    ASSERT_TRUE(unit.start().is_ok());
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(unit.count(), 0);
}

TEST_F(ServiceUnitTest, TaskExceptionIsContainedAndReported) {
    counter_unit unit(logger_);
    auto observer = std::make_shared<recording_observer>();
    ASSERT_TRUE(unit.register_observer(observer).is_ok());
    ASSERT_TRUE(unit.start().is_ok());

    unit.throw_later();
    EXPECT_EQ(unit.increment(), 1);

    EXPECT_EQ(observer->count(intelligence_event_kind::task_fault), 1u);
    EXPECT_EQ(unit.get_unit_metrics().task_faults.load(), 1u);
    EXPECT_TRUE(logger_->contains("[counter_unit]"));
    EXPECT_TRUE(logger_->contains("boom"));
}

TEST_F(ServiceUnitTest, NonStandardExceptionFromTickIsContained) {
    counter_unit unit(logger_);
    auto observer = std::make_shared<recording_observer>();
    ASSERT_TRUE(unit.register_observer(observer).is_ok());
    ASSERT_TRUE(unit.start().is_ok());

    unit.throw_int_after(5ms);
    ASSERT_TRUE(wait_for([&]() { return unit.get_unit_metrics().task_faults.load() == 1u; }));

    // The worker survives and keeps serving requests.
    EXPECT_TRUE(unit.is_running());
    EXPECT_EQ(unit.increment(), 1);
    EXPECT_EQ(observer->count(intelligence_event_kind::task_fault), 1u);
    EXPECT_TRUE(logger_->contains("unknown exception"));
    ASSERT_TRUE(unit.stop().is_ok());
}

TEST_F(ServiceUnitTest, ObserverRegistration) {
    counter_unit unit;
    auto observer = std::make_shared<recording_observer>();

    EXPECT_TRUE(unit.register_observer(observer).is_ok());
    EXPECT_EQ(error_code_of(unit.register_observer(observer)), vsm_error_code::already_exists);
    EXPECT_EQ(error_code_of(unit.register_observer(nullptr)), vsm_error_code::invalid_argument);

    unit.emit("hello");
    EXPECT_EQ(observer->count(intelligence_event_kind::scan_completed), 1u);

    EXPECT_TRUE(unit.unregister_observer(observer).is_ok());
    EXPECT_EQ(error_code_of(unit.unregister_observer(observer)), vsm_error_code::not_found);

    unit.emit("ignored");
    EXPECT_EQ(observer->count(intelligence_event_kind::scan_completed), 1u);
}
