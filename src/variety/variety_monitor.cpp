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

#include "kcenon/vsm/variety/variety_monitor.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace kcenon::vsm {

variety_monitor::variety_monitor(const variety_monitor_config& config,
                                 std::shared_ptr<policy_authority> policy,
                                 std::shared_ptr<resource_authority> resources,
                                 logger_ptr logger)
    : service_unit("variety_monitor", std::move(logger))
    , config_(config)
    , policy_(std::move(policy))
    , resources_(std::move(resources))
    , protocols_(default_emergency_protocols())
    , capacity_(std::clamp(config.initial_capacity, config.min_capacity, config.max_capacity))
    , absorption_rate_(config.initial_absorption_rate) {
    metrics_.absorption_rate = absorption_rate_;
}

variety_monitor::~variety_monitor() {
    stop();
}

// ========== Requests ==========

risk_report variety_monitor::monitor_variety(const variety_data& data) {
    return request([this, &data]() {
        risk_report report;
        report.external_variety = calculate_external_variety(data);

        // Trend reflects the history before this sample.
        const auto trend = classify_trend(history_values());

        current_variety_ = report.external_variety;
        report.internal_capacity = capacity_;
        report.variety_ratio = current_variety_ / capacity_;
        report.explosion_risk = calculate_explosion_risk(report.variety_ratio, trend,
                                                         absorption_rate_, config_.critical_ratio);
        report.action = recommend_action(report.explosion_risk, report.variety_ratio);
        report.absorption_capability = calculate_absorption_capability(absorption_rate_, current_variety_);

        history_.emplace_back(std::chrono::steady_clock::now(), current_variety_);
        while (history_.size() > config_.history_limit) {
            history_.pop_front();
        }
        ++samples_seen_;
        metrics_.average_variety += (current_variety_ - metrics_.average_variety) /
                                    static_cast<double>(samples_seen_);
        metrics_.peak_variety = std::max(metrics_.peak_variety, current_variety_);

        std::ostringstream oss;
        oss << "variety " << report.external_variety << " ratio " << report.variety_ratio
            << " risk " << report.explosion_risk << " -> " << to_string(report.action);
        log(log_level::trace, oss.str());

        if (report.explosion_risk > config_.explosion_threshold) {
            handle_explosion_threat(report);
        } else if (last_explosion_) {
            metrics_.recovery_time_seconds = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - *last_explosion_).count();
            last_explosion_.reset();
        }
        return report;
    });
}

explosion_risk_assessment variety_monitor::check_explosion_risk() const {
    return request([this]() {
        explosion_risk_assessment assessment;
        const auto values = history_values();
        const double ratio = current_variety_ / capacity_;

        assessment.trend = classify_trend(values);
        assessment.current_risk = calculate_explosion_risk(ratio, assessment.trend,
                                                           absorption_rate_, config_.critical_ratio);
        assessment.cascade_probability = calculate_cascade_probability(ratio, config_.cascade_threshold);
        assessment.mitigation_options = mitigation_options(current_variety_, capacity_);

        if (history_.size() >= 2) {
            const auto& latest = history_.back();
            const auto& previous = history_[history_.size() - 2];
            const double remaining = capacity_ * config_.critical_ratio - current_variety_;
            const double delta = latest.second - previous.second;

            // Non-increasing variety never reaches the threshold.
            if (delta <= 0.0) {
                assessment.time_to_explosion_seconds = std::numeric_limits<double>::infinity();
            } else if (remaining <= 0.0) {
                assessment.time_to_explosion_seconds = 0.0;
            } else {
                const double elapsed = std::max(
                    std::chrono::duration<double>(latest.first - previous.first).count(), 0.001);
                assessment.time_to_explosion_seconds = remaining / (delta / elapsed);
            }
        }
        return assessment;
    });
}

cascade_prediction variety_monitor::predict_cascade(double variety) {
    return request([this, variety]() { return record_cascade(variety); });
}

variety_state variety_monitor::run_assessment() {
    return request([this]() {
        assess();
        return snapshot_state();
    });
}

variety_state variety_monitor::get_variety_state() const {
    return request([this]() { return snapshot_state(); });
}

std::vector<explosion_event> variety_monitor::get_explosion_events() const {
    return request([this]() {
        return std::vector<explosion_event>(explosion_events_.begin(), explosion_events_.end());
    });
}

std::vector<cascade_prediction> variety_monitor::get_cascade_predictions() const {
    return request([this]() {
        return std::vector<cascade_prediction>(cascade_predictions_.begin(),
                                               cascade_predictions_.end());
    });
}

intervention_state variety_monitor::get_interventions() const {
    return request([this]() { return interventions_; });
}

void variety_monitor::set_emergency_protocols(std::vector<emergency_protocol> protocols) {
    request([this, p = std::move(protocols)]() mutable {
        protocols_ = std::move(p);
        return true;
    });
}

void variety_monitor::set_policy_authority(std::shared_ptr<policy_authority> policy) {
    request([this, p = std::move(policy)]() mutable {
        policy_ = std::move(p);
        return true;
    });
}

void variety_monitor::set_resource_authority(std::shared_ptr<resource_authority> resources) {
    request([this, r = std::move(resources)]() mutable {
        resources_ = std::move(r);
        return true;
    });
}

result_void variety_monitor::validate_start() {
    if (!config_.validate()) {
        return make_void_error(vsm_error_code::invalid_configuration,
                               "Invalid variety monitor configuration");
    }
    return make_void_success();
}

void variety_monitor::on_started() {
    schedule_assessment();
}

void variety_monitor::schedule_assessment() {
    schedule_after(config_.assessment_interval, [this]() {
        assess();
        if (is_running()) {
            schedule_assessment();
        }
    });
}

// ========== Emergency response ==========

void variety_monitor::handle_explosion_threat(risk_report& report) {
    log(log_level::warning, "variety explosion threat at risk " +
                            std::to_string(report.explosion_risk));

    explosion_event event;
    spawn_requested_ = false;
    const auto strategy = select_absorption_strategy(report.variety_ratio);
    auto absorbed = execute_absorption(strategy, report.external_variety,
                                       report.absorption_capability);

    absorption_outcome outcome;
    outcome.strategy = strategy.type;
    if (absorbed.is_err()) {
        outcome.capacity_exceeded = true;
        event.uncontrolled = true;

        log(log_level::error, "uncontrolled variety explosion: " + absorbed.error().message);
        publish(intelligence_event_kind::uncontrolled_explosion, absorbed.error().message,
                report.external_variety);

        meta_system_spawn_request spawn;
        spawn.variety_level = report.external_variety;
        spawn.variety_ratio = report.variety_ratio;
        spawn.explosion_risk = report.explosion_risk;
        if (!policy_) {
            log(log_level::error, "no policy authority to spawn a meta-system");
        } else {
            auto submitted = policy_->spawn_meta_system_emergency(spawn);
            interventions_.meta_system_requests++;
            if (submitted.is_err()) {
                log(log_level::error, "meta-system spawn request failed: " +
                                      submitted.error().message);
            } else {
                spawn_requested_ = true;
            }
        }
    } else {
        outcome = absorbed.value();
        absorption_rate_ = absorption_rate_ * 0.9 + 0.1;
        metrics_.absorption_rate = absorption_rate_;
        log(log_level::info, strategy.name + " absorbed " + std::to_string(outcome.absorbed));
    }
    report.absorption = outcome;

    const auto protocol = select_emergency_protocol(report.explosion_risk, protocols_);
    event.explosion_data = report;
    event.protocol_used = protocol.kind;
    event.response_result = execute_protocol(protocol, report);

    explosion_events_.push_back(event);
    while (explosion_events_.size() > config_.event_history_limit) {
        explosion_events_.pop_front();
    }
    metrics_.explosion_count++;
    metrics_.peak_variety = std::max(metrics_.peak_variety, report.external_variety);
    explosions_since_assessment_++;
    last_explosion_ = std::chrono::steady_clock::now();

    publish(intelligence_event_kind::explosion_recorded,
            event.response_result.protocol_name + " executed", report.explosion_risk);
}

protocol_result variety_monitor::execute_protocol(const emergency_protocol& protocol,
                                                  const risk_report& report) {
    protocol_result result;
    result.protocol = protocol.kind;
    result.protocol_name = protocol.name;

    for (const auto& action : protocol.actions) {
        auto outcome = execute_protocol_action(action, report);
        protocol_action_result action_result;
        action_result.action = action;
        action_result.success = outcome.is_ok();
        if (outcome.is_err()) {
            action_result.detail = outcome.error().message;
            log(log_level::error, "protocol action '" + action + "' failed: " +
                                  outcome.error().message);
            publish(intelligence_event_kind::protocol_action_failed, outcome.error().message);
        }
        result.success = result.success && action_result.success;
        result.action_results.push_back(std::move(action_result));
    }

    if (protocol.kind != protocol_kind::none) {
        log(log_level::warning, "emergency protocol " + protocol.name +
                                (result.success ? " completed" : " completed with failures"));
    }
    return result;
}

result_void variety_monitor::execute_protocol_action(const std::string& action,
                                                     const risk_report& report) {
    if (action == "spawn_meta_system") {
        if (spawn_requested_) {
            log(log_level::debug, "meta-system spawn already requested for this explosion");
            return make_void_success();
        }
        if (!policy_) {
            return make_void_error(vsm_error_code::operation_failed, "No policy authority");
        }
        meta_system_spawn_request spawn;
        spawn.variety_level = report.external_variety;
        spawn.variety_ratio = report.variety_ratio;
        spawn.explosion_risk = report.explosion_risk;
        interventions_.meta_system_requests++;
        auto submitted = policy_->spawn_meta_system_emergency(spawn);
        spawn_requested_ = submitted.is_ok();
        return submitted;
    }
    if (action == "redistribute_variety") {
        if (!resources_) {
            return make_void_error(vsm_error_code::operation_failed, "No resource authority");
        }
        interventions_.redistributions++;
        return resources_->redistribute_variety(report);
    }
    if (action == "activate_filters") {
        interventions_.filters_active = true;
    } else if (action == "reduce_inputs") {
        interventions_.inputs_reduced = true;
    } else if (action == "isolate_subsystems") {
        interventions_.subsystems_isolated = true;
    } else if (action == "activate_dampeners") {
        interventions_.dampeners_active = true;
    } else if (action == "reduce_functionality") {
        interventions_.degraded_mode = true;
    } else if (action == "preserve_core") {
        interventions_.core_preserved = true;
    } else {
        return make_void_error(vsm_error_code::unknown_protocol_action,
                               "Unknown protocol action: " + action);
    }
    return make_void_success();
}

// ========== Assessment ==========

cascade_prediction variety_monitor::record_cascade(double variety) {
    auto prediction = simulate_cascade(variety, capacity_, classify_trend(history_values()),
                                       calculate_absorption_capability(absorption_rate_, current_variety_));
    cascade_predictions_.push_back(prediction);
    while (cascade_predictions_.size() > config_.prediction_history_limit) {
        cascade_predictions_.pop_front();
    }
    return prediction;
}

void variety_monitor::assess() {
    const double ratio = current_variety_ / capacity_;
    if (ratio > config_.critical_ratio) {
        auto prediction = record_cascade(current_variety_);
        if (prediction.containment_probability < 0.5) {
            metrics_.cascade_events++;
            log(log_level::warning, "cascade risk with containment " +
                                    std::to_string(prediction.containment_probability));
            publish(intelligence_event_kind::cascade_risk, "cascade unlikely to be contained",
                    prediction.containment_probability);

            if (policy_) {
                cascade_risk_report cascade;
                cascade.prediction = std::move(prediction);
                auto submitted = policy_->handle_cascade_risk(cascade);
                if (submitted.is_err()) {
                    log(log_level::error, "cascade risk report failed: " + submitted.error().message);
                }
            }
        }
    }

    const double previous = capacity_;
    if (explosions_since_assessment_ > 0) {
        capacity_ *= 1.05;
    } else if (current_variety_ < capacity_ * 0.5) {
        capacity_ *= 0.98;
    } else {
        capacity_ *= 1.01;
    }
    capacity_ = std::clamp(capacity_, config_.min_capacity, config_.max_capacity);
    explosions_since_assessment_ = 0;

    std::ostringstream oss;
    oss << "assessment: ratio " << ratio << ", capacity " << previous << " -> " << capacity_;
    log(log_level::debug, oss.str());
}

std::vector<double> variety_monitor::history_values() const {
    std::vector<double> values;
    values.reserve(history_.size());
    for (const auto& entry : history_) {
        values.push_back(entry.second);
    }
    return values;
}

variety_state variety_monitor::snapshot_state() const {
    variety_state state;
    state.current_variety_level = current_variety_;
    state.internal_variety_capacity = capacity_;
    state.variety_ratio = current_variety_ / capacity_;
    state.explosion_events = explosion_events_.size();
    state.cascade_predictions = cascade_predictions_.size();
    state.metrics = metrics_;
    state.metrics.absorption_rate = absorption_rate_;
    state.monitoring_active = is_running();
    return state;
}

} // namespace kcenon::vsm
