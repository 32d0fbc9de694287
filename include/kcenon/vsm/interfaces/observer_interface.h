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
 * @file observer_interface.h
 * @brief Observer interfaces for intelligence-layer observability events
 *
 * Every anomaly, explosion and fault handled by a unit is published to the
 * registered observers, even when the unit recovers from it locally.
 */

#include <chrono>
#include <memory>
#include <string>

#include "../core/result_types.h"

namespace kcenon::vsm {

/**
 * @enum intelligence_event_kind
 * @brief Kinds of events published by intelligence units
 */
enum class intelligence_event_kind {
    scan_completed,
    source_unavailable,
    pattern_emerged,
    meta_pattern_formed,
    emergence_recorded,
    explosion_recorded,
    uncontrolled_explosion,
    cascade_risk,
    protocol_action_failed,
    adaptation_started,
    adaptation_completed,
    resource_constrained,
    progress_fault,
    task_fault
};

constexpr const char* to_string(intelligence_event_kind kind) noexcept {
    switch (kind) {
        case intelligence_event_kind::scan_completed: return "scan_completed";
        case intelligence_event_kind::source_unavailable: return "source_unavailable";
        case intelligence_event_kind::pattern_emerged: return "pattern_emerged";
        case intelligence_event_kind::meta_pattern_formed: return "meta_pattern_formed";
        case intelligence_event_kind::emergence_recorded: return "emergence_recorded";
        case intelligence_event_kind::explosion_recorded: return "explosion_recorded";
        case intelligence_event_kind::uncontrolled_explosion: return "uncontrolled_explosion";
        case intelligence_event_kind::cascade_risk: return "cascade_risk";
        case intelligence_event_kind::protocol_action_failed: return "protocol_action_failed";
        case intelligence_event_kind::adaptation_started: return "adaptation_started";
        case intelligence_event_kind::adaptation_completed: return "adaptation_completed";
        case intelligence_event_kind::resource_constrained: return "resource_constrained";
        case intelligence_event_kind::progress_fault: return "progress_fault";
        case intelligence_event_kind::task_fault: return "task_fault";
        default: return "unknown";
    }
}

/**
 * @class intelligence_event
 * @brief Immutable observability event emitted by a unit
 *
 * @example
 * @code
 * intelligence_event event(intelligence_event_kind::explosion_recorded,
 *                          "variety_monitor", "meta_spawn executed", 0.95);
 * @endcode
 */
class intelligence_event {
public:
    intelligence_event(intelligence_event_kind kind,
                       const std::string& source,
                       const std::string& message,
                       double value = 0.0)
        : kind_(kind), source_(source), message_(message), value_(value),
          timestamp_(std::chrono::system_clock::now()) {}

    intelligence_event_kind kind() const { return kind_; }
    const std::string& source() const { return source_; }
    const std::string& message() const { return message_; }
    double value() const { return value_; }
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }

private:
    intelligence_event_kind kind_;
    std::string source_;
    std::string message_;
    double value_;
    std::chrono::system_clock::time_point timestamp_;
};

/**
 * @class interface_intelligence_observer
 * @brief Receives events from intelligence units
 *
 * @thread_safety Implementations MUST be thread-safe. Each unit notifies
 *                from its own worker thread.
 */
class interface_intelligence_observer {
public:
    virtual ~interface_intelligence_observer() = default;

    /**
     * @brief Called when a unit publishes an event
     * @param event The published event
     */
    virtual void on_intelligence_event(const intelligence_event& event) = 0;
};

/**
 * @class interface_intelligence_observable
 * @brief Subject side of the intelligence observer pattern
 */
class interface_intelligence_observable {
public:
    virtual ~interface_intelligence_observable() = default;

    virtual common::VoidResult register_observer(
        std::shared_ptr<interface_intelligence_observer> observer) = 0;

    virtual common::VoidResult unregister_observer(
        std::shared_ptr<interface_intelligence_observer> observer) = 0;
};

} // namespace kcenon::vsm
