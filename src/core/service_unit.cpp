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

#include "kcenon/vsm/core/service_unit.h"

#include <algorithm>
#include <exception>

namespace kcenon::vsm {

service_unit::service_unit(std::string name, logger_ptr logger)
    : name_(std::move(name)), logger_(std::move(logger)) {}

service_unit::~service_unit() {
    if (running_.load()) {
        stop();
    }
}

result_void service_unit::start() {
    if (running_.load()) {
        return make_void_error(vsm_error_code::already_started,
                               name_ + " is already running");
    }

    auto validation = validate_start();
    if (validation.is_err()) {
        return validation;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(true);
    }
    worker_ = std::thread(&service_unit::worker_loop, this);

    log(log_level::info, "started");
    on_started();
    return make_void_success();
}

result_void service_unit::stop() {
    if (on_worker_thread()) {
        return make_void_error(vsm_error_code::invalid_state,
                               name_ + " cannot be stopped from its own worker");
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load()) {
            return make_void_success();
        }
        running_.store(false);
        timers_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    worker_id_.store(std::thread::id{});

    {
        // Ticks running during shutdown may have re-armed themselves.
        std::lock_guard<std::mutex> lock(queue_mutex_);
        timers_.clear();
    }

    log(log_level::info, "stopped");
    return make_void_success();
}

bool service_unit::is_running() const {
    return running_.load();
}

common::VoidResult service_unit::register_observer(
    std::shared_ptr<interface_intelligence_observer> observer) {
    if (!observer) {
        return make_void_error(vsm_error_code::invalid_argument,
                               "Observer cannot be null");
    }

    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end()) {
        return make_void_error(vsm_error_code::already_exists,
                               "Observer already registered");
    }
    observers_.push_back(std::move(observer));
    return make_void_success();
}

common::VoidResult service_unit::unregister_observer(
    std::shared_ptr<interface_intelligence_observer> observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    auto it = std::find(observers_.begin(), observers_.end(), observer);
    if (it == observers_.end()) {
        return make_void_error(vsm_error_code::not_found,
                               "Observer not registered");
    }
    observers_.erase(it);
    return make_void_success();
}

void service_unit::set_logger(logger_ptr logger) {
    std::lock_guard<std::mutex> lock(logger_mutex_);
    logger_ = std::move(logger);
}

void service_unit::notify(task fn) {
    if (!enqueue(fn)) {
        std::lock_guard<std::recursive_mutex> exec_lock(exec_mutex_);
        fn();
    }
    unit_metrics_.notifications_processed++;
}

void service_unit::schedule_after(std::chrono::milliseconds delay, task fn) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        timers_.emplace(std::chrono::steady_clock::now() + delay, std::move(fn));
    }
    cv_.notify_one();
}

void service_unit::log(log_level level, const std::string& message) const {
    logger_ptr logger;
    {
        std::lock_guard<std::mutex> lock(logger_mutex_);
        logger = logger_;
    }
    if (!logger || !logger->is_enabled(level)) {
        return;
    }

    auto result = logger->log(level, "[" + name_ + "] " + message);
    if (result.is_err()) {
        unit_metrics_.log_failures++;
    }
}

void service_unit::publish(intelligence_event_kind kind, const std::string& message,
                           double value) const {
    std::vector<std::shared_ptr<interface_intelligence_observer>> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    intelligence_event event(kind, name_, message, value);
    for (const auto& observer : observers) {
        observer->on_intelligence_event(event);
    }
}

bool service_unit::on_worker_thread() const {
    return worker_id_.load() == std::this_thread::get_id();
}

bool service_unit::enqueue(task fn) const {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load()) {
            return false;
        }
        queue_.push_back(std::move(fn));
    }
    cv_.notify_one();
    return true;
}

void service_unit::worker_loop() {
    worker_id_.store(std::this_thread::get_id());

    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        if (!queue_.empty()) {
            auto next = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            execute(next, "task");
            lock.lock();
            continue;
        }

        if (!running_.load()) {
            break;
        }

        if (!timers_.empty() &&
            timers_.begin()->first <= std::chrono::steady_clock::now()) {
            auto next = std::move(timers_.begin()->second);
            timers_.erase(timers_.begin());
            lock.unlock();
            execute(next, "tick");
            unit_metrics_.ticks_processed++;
            lock.lock();
            continue;
        }

        // Re-evaluated on every wake-up; new work and new timers both notify.
        if (timers_.empty()) {
            cv_.wait(lock);
        } else {
            cv_.wait_until(lock, timers_.begin()->first);
        }
    }
}

void service_unit::execute(const task& fn, const char* origin) {
    std::lock_guard<std::recursive_mutex> exec_lock(exec_mutex_);
    try {
        fn();
    } catch (const std::exception& e) {
        unit_metrics_.task_faults++;
        log(log_level::error, std::string(origin) + " failed: " + e.what());
        publish(intelligence_event_kind::task_fault, e.what());
    } catch (...) {
        unit_metrics_.task_faults++;
        log(log_level::error, std::string(origin) + " failed: unknown exception");
        publish(intelligence_event_kind::task_fault, "unknown exception");
    }
}

} // namespace kcenon::vsm
