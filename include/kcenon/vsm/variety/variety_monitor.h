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
 * @file variety_monitor.h
 * @brief Variety explosion detection and emergency response
 */

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "variety_model.h"
#include "variety_types.h"
#include "../config/intelligence_config.h"
#include "../core/service_unit.h"
#include "../interfaces/policy_authority.h"
#include "../interfaces/resource_authority.h"

namespace kcenon::vsm {

/**
 * @class variety_monitor
 * @brief Compares external variety against adaptive internal capacity
 *
 * When monitor_variety() scores a risk above the explosion threshold,
 * absorption and the selected emergency protocol run before the request
 * returns, so the reply already reflects the remediation taken.
 *
 * The periodic assessment predicts cascades above the critical ratio and
 * adapts the internal capacity within [min_capacity, max_capacity].
 *
 * @thread_safety All public methods are thread-safe.
 *
 * @example
 * @code
 * variety_monitor monitor(variety_monitor_config{}, policy, resources);
 * monitor.start();
 *
 * variety_data data;
 * data.novel_patterns = {"p1", "p2", "p3"};
 * auto report = monitor.monitor_variety(data);
 * if (report.action != recommended_action::monitor) {
 *     // escalate
 * }
 * @endcode
 */
class variety_monitor : public service_unit {
public:
    explicit variety_monitor(const variety_monitor_config& config = variety_monitor_config{},
                             std::shared_ptr<policy_authority> policy = nullptr,
                             std::shared_ptr<resource_authority> resources = nullptr,
                             logger_ptr logger = nullptr);

    ~variety_monitor() override;

    /**
     * @brief Score a variety sample and remediate when it is explosive
     */
    risk_report monitor_variety(const variety_data& data);

    explosion_risk_assessment check_explosion_risk() const;

    /**
     * @brief Predict how @p variety would cascade at the current capacity
     *
     * The prediction is stored in the bounded prediction history.
     */
    cascade_prediction predict_cascade(double variety);

    /**
     * @brief Run one periodic assessment immediately
     */
    variety_state run_assessment();

    variety_state get_variety_state() const;

    std::vector<explosion_event> get_explosion_events() const;

    std::vector<cascade_prediction> get_cascade_predictions() const;

    intervention_state get_interventions() const;

    /**
     * @brief Replace the emergency protocol table
     */
    void set_emergency_protocols(std::vector<emergency_protocol> protocols);

    void set_policy_authority(std::shared_ptr<policy_authority> policy);

    void set_resource_authority(std::shared_ptr<resource_authority> resources);

protected:
    result_void validate_start() override;
    void on_started() override;

private:
    using sample = std::pair<std::chrono::steady_clock::time_point, double>;

    std::vector<double> history_values() const;
    void handle_explosion_threat(risk_report& report);
    protocol_result execute_protocol(const emergency_protocol& protocol, const risk_report& report);
    result_void execute_protocol_action(const std::string& action, const risk_report& report);
    cascade_prediction record_cascade(double variety);
    void assess();
    void schedule_assessment();
    variety_state snapshot_state() const;

    variety_monitor_config config_;
    std::shared_ptr<policy_authority> policy_;
    std::shared_ptr<resource_authority> resources_;
    std::vector<emergency_protocol> protocols_;

    double current_variety_{0.0};
    double capacity_;
    double absorption_rate_;
    std::deque<sample> history_;
    std::deque<explosion_event> explosion_events_;
    std::deque<cascade_prediction> cascade_predictions_;
    variety_metrics metrics_;
    intervention_state interventions_;

    uint64_t samples_seen_{0};
    uint64_t explosions_since_assessment_{0};
    bool spawn_requested_{false};
    std::optional<std::chrono::steady_clock::time_point> last_explosion_;
};

} // namespace kcenon::vsm
