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
 * @file service_unit.h
 * @brief Message-driven base for intelligence units
 *
 * A service unit owns one worker thread that processes queued requests,
 * notifications and self-scheduled timer ticks strictly one at a time.
 * State owned by a derived unit is only touched from tasks run through this
 * base, so every request and tick observes a consistent state.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>

#include "result_types.h"
#include "../interfaces/observer_interface.h"

namespace kcenon::vsm {

using logger_ptr = std::shared_ptr<common::interfaces::ILogger>;
using log_level = common::interfaces::log_level;

/**
 * @struct service_unit_metrics
 * @brief Counters for work processed by a unit
 */
struct service_unit_metrics {
    std::atomic<uint64_t> requests_processed{0};
    std::atomic<uint64_t> notifications_processed{0};
    std::atomic<uint64_t> ticks_processed{0};
    std::atomic<uint64_t> task_faults{0};
    std::atomic<uint64_t> log_failures{0};

    service_unit_metrics() = default;

    service_unit_metrics(const service_unit_metrics& other)
        : requests_processed(other.requests_processed.load())
        , notifications_processed(other.notifications_processed.load())
        , ticks_processed(other.ticks_processed.load())
        , task_faults(other.task_faults.load())
        , log_failures(other.log_failures.load()) {}
};

/**
 * @class service_unit
 * @brief Worker thread with a serialized task queue and timers
 *
 * - request(): blocks the caller until the worker has produced a reply
 * - notify(): enqueues work and returns immediately
 * - schedule_after(): runs work on the worker after a delay
 *
 * Before start() and after stop(), requests and notifications execute
 * inline on the calling thread under the unit's execution lock. Timers
 * scheduled while stopped fire once the unit is started.
 *
 * Derived classes must call stop() from their own destructor so the worker
 * never runs against destroyed members.
 *
 * @thread_safety All public methods are thread-safe.
 */
class service_unit : public interface_intelligence_observable {
public:
    using task = std::function<void()>;

    explicit service_unit(std::string name, logger_ptr logger = nullptr);
    ~service_unit() override;

    service_unit(const service_unit&) = delete;
    service_unit& operator=(const service_unit&) = delete;
    service_unit(service_unit&&) = delete;
    service_unit& operator=(service_unit&&) = delete;

    // ========== Lifecycle Management ==========

    /**
     * @brief Start the worker thread
     * @return already_started if running, or the error from validate_start()
     */
    result_void start();

    /**
     * @brief Stop the worker thread after draining queued work
     *
     * Pending timers are discarded.
     */
    result_void stop();

    bool is_running() const;

    const std::string& name() const { return name_; }

    service_unit_metrics get_unit_metrics() const { return unit_metrics_; }

    // ========== Observers ==========

    common::VoidResult register_observer(
        std::shared_ptr<interface_intelligence_observer> observer) override;

    common::VoidResult unregister_observer(
        std::shared_ptr<interface_intelligence_observer> observer) override;

    void set_logger(logger_ptr logger);

protected:
    /**
     * @brief Run @p fn on the worker and wait for its value
     */
    template <typename F>
    auto request(F&& fn) const -> std::invoke_result_t<F&> {
        using reply_type = std::invoke_result_t<F&>;

        if (on_worker_thread()) {
            unit_metrics_.requests_processed++;
            return fn();
        }

        auto packaged = std::make_shared<std::packaged_task<reply_type()>>(std::forward<F>(fn));
        auto reply = packaged->get_future();

        if (!enqueue([packaged]() { (*packaged)(); })) {
            std::lock_guard<std::recursive_mutex> exec_lock(exec_mutex_);
            (*packaged)();
        }

        unit_metrics_.requests_processed++;
        return reply.get();
    }

    /**
     * @brief Queue @p fn for the worker without waiting
     */
    void notify(task fn);

    /**
     * @brief Run @p fn on the worker once @p delay has elapsed
     */
    void schedule_after(std::chrono::milliseconds delay, task fn);

    /**
     * @brief Hook for validating configuration before the worker starts
     */
    virtual result_void validate_start() { return make_void_success(); }

    /**
     * @brief Hook run once the worker is up; used to arm periodic timers
     */
    virtual void on_started() {}

    void log(log_level level, const std::string& message) const;

    void publish(intelligence_event_kind kind, const std::string& message,
                 double value = 0.0) const;

    bool on_worker_thread() const;

private:
    bool enqueue(task fn) const;
    void worker_loop();
    void execute(const task& fn, const char* origin);

    std::string name_;
    logger_ptr logger_;
    mutable std::mutex logger_mutex_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_{};

    mutable std::mutex queue_mutex_;
    mutable std::condition_variable cv_;
    mutable std::deque<task> queue_;
    std::multimap<std::chrono::steady_clock::time_point, task> timers_;

    mutable std::recursive_mutex exec_mutex_;

    mutable std::mutex observers_mutex_;
    std::vector<std::shared_ptr<interface_intelligence_observer>> observers_;

    mutable service_unit_metrics unit_metrics_;
};

} // namespace kcenon::vsm
