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
 * @file intelligence_coordinator.h
 * @brief Owns the four intelligence units and routes work between them
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "adaptation/adaptation_engine.h"
#include "config/intelligence_config.h"
#include "core/result_types.h"
#include "core/service_unit.h"
#include "interfaces/observer_interface.h"
#include "interfaces/policy_authority.h"
#include "interfaces/resource_authority.h"
#include "interfaces/signal_source.h"
#include "pattern/pattern_detector.h"
#include "scanner/scanner.h"
#include "variety/variety_monitor.h"

namespace kcenon::vsm {

/**
 * @struct intelligence_cycle_report
 * @brief Everything produced by one run_intelligence_cycle() call
 */
struct intelligence_cycle_report {
    signal_snapshot snapshot;
    detection_result detection;
    variety_data variety_input;
    risk_report risk;
    std::optional<adaptation_proposal> proposal;
    bool proposal_submitted{false};
};

/**
 * @class intelligence_coordinator
 * @brief Facade over scanner, pattern detector, variety monitor and adaptation engine
 *
 * Missing collaborators are replaced by the logging authorities. Periodic
 * scans are forwarded to the pattern detector's observation buffer.
 *
 * @example
 * @code
 * intelligence_coordinator intelligence(intelligence_config{}, policy, resources);
 * intelligence.start();
 *
 * auto cycle = intelligence.run_intelligence_cycle(scan_scope::full);
 * if (cycle.proposal) {
 *     // the policy authority has the proposal
 * }
 * intelligence.stop();
 * @endcode
 */
class intelligence_coordinator {
public:
    explicit intelligence_coordinator(
        const intelligence_config& config = intelligence_config{},
        std::shared_ptr<policy_authority> policy = nullptr,
        std::shared_ptr<resource_authority> resources = nullptr,
        std::shared_ptr<signal_source> source = std::make_shared<baseline_signal_source>(),
        std::shared_ptr<progress_probe> probe = std::make_shared<elapsed_time_probe>(),
        logger_ptr logger = nullptr);

    ~intelligence_coordinator();

    intelligence_coordinator(const intelligence_coordinator&) = delete;
    intelligence_coordinator& operator=(const intelligence_coordinator&) = delete;

    // ========== Lifecycle Management ==========

    /**
     * @brief Start every unit
     *
     * Units started before a failure are stopped again.
     */
    result_void start();

    result_void stop();

    bool is_running() const;

    // ========== Routing ==========

    /**
     * @brief Scan, detect, assess variety and escalate when needed
     */
    intelligence_cycle_report run_intelligence_cycle(scan_scope scope = scan_scope::full);

    // ========== Scanner ==========

    signal_snapshot scan(scan_scope scope) { return scanner_->scan(scope); }

    // ========== Pattern Detection ==========

    detection_result detect_patterns(const observation_batch& batch) {
        return detector_->detect_patterns(batch);
    }

    detection_result detect_patterns(const std::vector<double>& stream) {
        return detector_->detect_patterns(stream);
    }

    emergence_analysis analyze_emergence(const std::vector<pattern>& pattern_set) {
        return detector_->analyze_emergence(pattern_set);
    }

    result<evolution_record> track_evolution(const std::string& pattern_id) {
        return detector_->track_evolution(pattern_id);
    }

    result<trajectory_prediction> predict_pattern_trajectory(const pattern& target,
                                                             std::chrono::milliseconds horizon) {
        return detector_->predict_pattern_trajectory(target, horizon);
    }

    meta_pattern_analysis identify_meta_patterns() { return detector_->identify_meta_patterns(); }

    pattern_state get_pattern_state() const { return detector_->get_pattern_state(); }

    // ========== Variety ==========

    risk_report monitor_variety(const variety_data& data) { return monitor_->monitor_variety(data); }

    explosion_risk_assessment check_explosion_risk() const { return monitor_->check_explosion_risk(); }

    cascade_prediction predict_cascade(double variety) { return monitor_->predict_cascade(variety); }

    variety_state get_variety_state() const { return monitor_->get_variety_state(); }

    // ========== Adaptation ==========

    adaptation_proposal generate_proposal(const challenge& c) { return engine_->generate_proposal(c); }

    void implement_adaptation(const adaptation_proposal& proposal) {
        engine_->implement_adaptation(proposal);
    }

    std::vector<adaptation> get_active_adaptations() const { return engine_->get_active_adaptations(); }

    std::vector<adaptation> get_adaptation_history() const { return engine_->get_adaptation_history(); }

    adaptation_metrics get_adaptation_metrics() const { return engine_->get_adaptation_metrics(); }

    void request_proposals_for_viability(const viability_metrics& metrics) {
        engine_->request_proposals_for_viability(metrics);
    }

    // ========== Units ==========

    scanner& scanner_unit() { return *scanner_; }
    pattern_detector& detector_unit() { return *detector_; }
    variety_monitor& monitor_unit() { return *monitor_; }
    adaptation_engine& engine_unit() { return *engine_; }

    /**
     * @brief Register @p observer with every unit
     */
    common::VoidResult register_observer(std::shared_ptr<interface_intelligence_observer> observer);

    common::VoidResult unregister_observer(std::shared_ptr<interface_intelligence_observer> observer);

private:
    std::vector<service_unit*> units() const;
    void log(log_level level, const std::string& message) const;

    logger_ptr logger_;
    std::shared_ptr<policy_authority> policy_;
    std::shared_ptr<resource_authority> resources_;

    // Scanner last: it is destroyed first and its handler targets the detector.
    std::unique_ptr<pattern_detector> detector_;
    std::unique_ptr<variety_monitor> monitor_;
    std::unique_ptr<adaptation_engine> engine_;
    std::unique_ptr<scanner> scanner_;
};

} // namespace kcenon::vsm
