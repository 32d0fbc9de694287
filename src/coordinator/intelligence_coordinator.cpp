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

#include "kcenon/vsm/intelligence_coordinator.h"

#include <sstream>

namespace kcenon::vsm {

intelligence_coordinator::intelligence_coordinator(const intelligence_config& config,
                                                   std::shared_ptr<policy_authority> policy,
                                                   std::shared_ptr<resource_authority> resources,
                                                   std::shared_ptr<signal_source> source,
                                                   std::shared_ptr<progress_probe> probe,
                                                   logger_ptr logger)
    : logger_(logger)
    , policy_(policy ? std::move(policy) : std::make_shared<log_policy_authority>(logger))
    , resources_(resources ? std::move(resources) : std::make_shared<log_resource_authority>(logger)) {
    detector_ = std::make_unique<pattern_detector>(config.pattern, policy_,
                                                   std::make_shared<feature_distance_similarity>(),
                                                   logger);
    monitor_ = std::make_unique<variety_monitor>(config.variety, policy_, resources_, logger);
    engine_ = std::make_unique<adaptation_engine>(config.adaptation, policy_, resources_,
                                                  std::move(probe), logger);
    scanner_ = std::make_unique<scanner>(config.scanner, std::move(source), logger);

    pattern_detector* detector = detector_.get();
    scanner_->set_snapshot_handler([detector](const signal_snapshot& snapshot) {
        detector->submit_observations(observation_batch{snapshot_to_stream(snapshot), {}, {}});
    });
}

intelligence_coordinator::~intelligence_coordinator() {
    auto stopped = stop();
    (void)stopped;
}

// ========== Lifecycle Management ==========

result_void intelligence_coordinator::start() {
    std::vector<service_unit*> started;
    for (auto* unit : units()) {
        auto result = unit->start();
        if (result.is_err()) {
            log(log_level::error, "failed to start " + unit->name() + ": " + result.error().message);
            for (auto it = started.rbegin(); it != started.rend(); ++it) {
                auto rollback = (*it)->stop();
                if (rollback.is_err()) {
                    log(log_level::error, "failed to stop " + (*it)->name() + ": " +
                                          rollback.error().message);
                }
            }
            return result;
        }
        started.push_back(unit);
    }
    log(log_level::info, "intelligence units started");
    return make_void_success();
}

result_void intelligence_coordinator::stop() {
    // Scanner first so no scan is forwarded to a stopped detector.
    auto all = units();
    result_void first_error = make_void_success();
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        if (!(*it)->is_running()) {
            continue;
        }
        auto result = (*it)->stop();
        if (result.is_err() && first_error.is_ok()) {
            first_error = result;
        }
    }
    return first_error;
}

bool intelligence_coordinator::is_running() const {
    for (auto* unit : units()) {
        if (!unit->is_running()) {
            return false;
        }
    }
    return true;
}

// ========== Routing ==========

intelligence_cycle_report intelligence_coordinator::run_intelligence_cycle(scan_scope scope) {
    intelligence_cycle_report report;
    report.snapshot = scanner_->scan(scope);
    report.detection = detector_->detect_patterns(report.snapshot);

    if (report.snapshot.llm_variety) {
        report.variety_input = *report.snapshot.llm_variety;
    } else {
        report.variety_input.novel_patterns = report.detection.emergent_ids;
        for (const auto& meta : report.detection.meta_patterns) {
            report.variety_input.emergent_properties.push_back(meta.id);
        }
    }

    report.risk = monitor_->monitor_variety(report.variety_input);

    std::ostringstream oss;
    oss << "cycle " << to_string(scope) << ": " << report.detection.patterns.size()
        << " patterns, ratio " << report.risk.variety_ratio << " -> " << to_string(report.risk.action);
    log(log_level::debug, oss.str());

    if (report.risk.action != recommended_action::monitor) {
        challenge c;
        c.type = challenge_type::variety_explosion;
        c.urgency = report.risk.explosion_risk > 0.7 ? challenge_urgency::high
                                                     : challenge_urgency::medium;
        c.scope = "system_wide";

        report.proposal = engine_->generate_proposal(c);
        auto submitted = policy_->approve_adaptation(*report.proposal);
        report.proposal_submitted = submitted.is_ok();
        if (submitted.is_err()) {
            log(log_level::error, "approval submission for " + report.proposal->id + " failed: " +
                                  submitted.error().message);
        }
    }
    return report;
}

// ========== Observers ==========

common::VoidResult intelligence_coordinator::register_observer(
    std::shared_ptr<interface_intelligence_observer> observer) {
    for (auto* unit : units()) {
        auto result = unit->register_observer(observer);
        if (result.is_err()) {
            return result;
        }
    }
    return make_void_success();
}

common::VoidResult intelligence_coordinator::unregister_observer(
    std::shared_ptr<interface_intelligence_observer> observer) {
    for (auto* unit : units()) {
        auto result = unit->unregister_observer(observer);
        if (result.is_err()) {
            return result;
        }
    }
    return make_void_success();
}

std::vector<service_unit*> intelligence_coordinator::units() const {
    return {detector_.get(), monitor_.get(), engine_.get(), scanner_.get()};
}

void intelligence_coordinator::log(log_level level, const std::string& message) const {
    if (logger_ && logger_->is_enabled(level)) {
        auto result = logger_->log(level, "[intelligence_coordinator] " + message);
        (void)result;
    }
}

} // namespace kcenon::vsm
