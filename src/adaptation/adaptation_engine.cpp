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

#include "kcenon/vsm/adaptation/adaptation_engine.h"

#include <algorithm>
#include <exception>
#include <sstream>

namespace kcenon::vsm {

namespace {

// Probe completion is honoured only from this progress onwards.
constexpr double completion_progress = 0.9;

double capacity_for(size_t active) noexcept {
    if (active >= 5) {
        return 0.2;
    }
    if (active >= 3) {
        return 0.5;
    }
    return 0.9;
}

} // namespace

adaptation_engine::adaptation_engine(const adaptation_engine_config& config,
                                     std::shared_ptr<policy_authority> policy,
                                     std::shared_ptr<resource_authority> resources,
                                     std::shared_ptr<progress_probe> probe,
                                     logger_ptr logger)
    : service_unit("adaptation_engine", std::move(logger))
    , config_(config)
    , policy_(std::move(policy))
    , resources_(std::move(resources))
    , probe_(std::move(probe)) {
}

adaptation_engine::~adaptation_engine() {
    stop();
}

// ========== Proposals ==========

adaptation_proposal adaptation_engine::generate_proposal(const challenge& c) {
    return request([this, &c]() { return make_proposal(c); });
}

result_void adaptation_engine::handle_adaptation_needed(const challenge& c) {
    return request([this, &c]() { return submit_for_approval(make_proposal(c)); });
}

void adaptation_engine::request_proposals_for_viability(const viability_metrics& metrics) {
    notify([this, metrics]() {
        std::vector<challenge> challenges;
        if (metrics.system_health && *metrics.system_health < 0.7) {
            challenges.push_back({challenge_type::health, challenge_urgency::high, "system_wide"});
        }
        if (metrics.resource_efficiency && *metrics.resource_efficiency < 0.6) {
            challenges.push_back({challenge_type::efficiency, challenge_urgency::medium, "operational"});
        }
        if (metrics.innovation_lag && *metrics.innovation_lag > 0.8) {
            challenges.push_back({challenge_type::innovation, challenge_urgency::low, "strategic"});
        }

        size_t failed = 0;
        for (const auto& c : challenges) {
            // Remaining challenges still go out after a failed submission.
            if (submit_for_approval(make_proposal(c)).is_err()) {
                ++failed;
            }
        }
        log(log_level::debug, "viability review raised " + std::to_string(challenges.size()) +
                              " challenges, " + std::to_string(failed) + " submissions failed");
    });
}

adaptation_proposal adaptation_engine::make_proposal(const challenge& c) {
    auto proposal = build_proposal(c);
    proposal.created_at = std::chrono::system_clock::now();

    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        proposal.created_at.time_since_epoch()).count();
    proposal.id = "ADAPT-" + std::to_string(epoch_ms) + "-" + std::to_string(++next_sequence_);

    std::ostringstream oss;
    oss << "proposal " << proposal.id << " (" << to_string(proposal.model_type) << ") for "
        << to_string(c.type) << "/" << to_string(c.urgency) << " impact " << proposal.impact;
    log(log_level::info, oss.str());
    return proposal;
}

result_void adaptation_engine::submit_for_approval(const adaptation_proposal& proposal) {
    if (!policy_) {
        log(log_level::warning, "no policy authority for " + proposal.id);
        return make_void_error(vsm_error_code::invalid_state, "No policy authority configured");
    }

    auto submitted = policy_->approve_adaptation(proposal);
    if (submitted.is_err()) {
        log(log_level::error, "approval submission for " + proposal.id + " failed: " +
                              submitted.error().message);
    }
    return submitted;
}

// ========== Active Adaptations ==========

void adaptation_engine::implement_adaptation(const adaptation_proposal& proposal) {
    notify([this, proposal]() {
        if (active_.count(proposal.id) > 0) {
            log(log_level::warning, "adaptation " + proposal.id + " already active, ignored");
            return;
        }

        adaptation active;
        active.proposal = proposal;
        active.started_at = std::chrono::system_clock::now();

        if (resources_) {
            auto allocated = resources_->allocate_for_adaptation(proposal);
            if (allocated.is_err()) {
                active.resource_constrained = true;
                log(log_level::warning, "resources denied for " + proposal.id + ": " +
                                        allocated.error().message);
                publish(intelligence_event_kind::resource_constrained, proposal.id);
            }
        }

        active_.emplace(proposal.id, std::move(active));
        log(log_level::info, "adaptation " + proposal.id + " started");
        publish(intelligence_event_kind::adaptation_started, proposal.id, proposal.impact);
        schedule_poll(proposal.id);
    });
}

result<adaptation_progress> adaptation_engine::poll_adaptation(const std::string& id) {
    return request([this, &id]() { return tick(id); });
}

void adaptation_engine::schedule_poll(const std::string& id) {
    schedule_after(config_.monitor_interval, [this, id]() {
        auto reading = tick(id);
        if (reading.is_ok() && !reading.value().completed) {
            schedule_poll(id);
        }
    });
}

adaptation_progress adaptation_engine::read_progress(const adaptation& active) {
    if (!probe_) {
        return adaptation_progress::safe_default();
    }

    try {
        auto reading = probe_->probe(active, std::chrono::system_clock::now());
        if (reading.is_ok()) {
            return reading.value();
        }
        log(log_level::error, probe_->name() + " failed for " + active.id() + ": " +
                              reading.error().message);
        publish(intelligence_event_kind::progress_fault, active.id());
    } catch (const std::exception& e) {
        log(log_level::error, probe_->name() + " threw for " + active.id() + ": " + e.what());
        publish(intelligence_event_kind::progress_fault, active.id());
    } catch (...) {
        log(log_level::error, probe_->name() + " threw an unknown exception for " + active.id());
        publish(intelligence_event_kind::progress_fault, active.id());
    }
    return adaptation_progress::safe_default();
}

result<adaptation_progress> adaptation_engine::tick(const std::string& id) {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return make_error<adaptation_progress>(vsm_error_code::not_found,
                                               "No active adaptation " + id);
    }

    auto reading = read_progress(it->second);
    it->second.polls++;

    std::ostringstream oss;
    oss << id << " progress " << reading.progress << " after " << it->second.polls << " polls";
    log(log_level::debug, oss.str());

    if (reading.completed && reading.progress < completion_progress) {
        log(log_level::warning, id + " reported complete at progress " +
                                std::to_string(reading.progress) + ", still in progress");
        reading.completed = false;
    }
    if (reading.completed) {
        complete(id, reading);
    }
    return make_success(reading);
}

void adaptation_engine::complete(const std::string& id, const adaptation_progress& outcome) {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return;
    }

    adaptation finished = std::move(it->second);
    active_.erase(it);

    finished.status = adaptation_status::completed;
    finished.completed_at = std::chrono::system_clock::now();
    finished.results = outcome;

    if (outcome.success) {
        metrics_.success_rate = metrics_.success_rate * 0.95 + 0.05;
        metrics_.resource_efficiency = std::min(1.0, metrics_.resource_efficiency +
                                                     outcome.efficiency_impact * 0.1);
    } else {
        metrics_.success_rate *= 0.95;
    }

    const double seconds = std::chrono::duration<double>(
        *finished.completed_at - finished.started_at).count();
    metrics_.completed_adaptations++;
    metrics_.average_completion_time_seconds +=
        (seconds - metrics_.average_completion_time_seconds) /
        static_cast<double>(metrics_.completed_adaptations);

    log(log_level::info, "adaptation " + id + (outcome.success ? " completed" : " failed"));
    publish(intelligence_event_kind::adaptation_completed, id, outcome.success ? 1.0 : 0.0);

    history_.push_back(std::move(finished));
    while (history_.size() > config_.history_limit) {
        history_.pop_front();
    }
}

// ========== Queries ==========

std::vector<adaptation> adaptation_engine::get_active_adaptations() const {
    return request([this]() {
        std::vector<adaptation> result;
        result.reserve(active_.size());
        for (const auto& [id, active] : active_) {
            result.push_back(active);
        }
        return result;
    });
}

std::vector<adaptation> adaptation_engine::get_adaptation_history() const {
    return request([this]() {
        return std::vector<adaptation>(history_.begin(), history_.end());
    });
}

adaptation_metrics adaptation_engine::get_adaptation_metrics() const {
    return request([this]() {
        adaptation_metrics snapshot = metrics_;
        snapshot.active_adaptations = active_.size();
        snapshot.adaptation_capacity = capacity_for(active_.size());
        return snapshot;
    });
}

// ========== Configuration ==========

void adaptation_engine::set_policy_authority(std::shared_ptr<policy_authority> policy) {
    request([this, p = std::move(policy)]() mutable {
        policy_ = std::move(p);
        return true;
    });
}

void adaptation_engine::set_resource_authority(std::shared_ptr<resource_authority> resources) {
    request([this, r = std::move(resources)]() mutable {
        resources_ = std::move(r);
        return true;
    });
}

void adaptation_engine::set_progress_probe(std::shared_ptr<progress_probe> probe) {
    request([this, p = std::move(probe)]() mutable {
        probe_ = std::move(p);
        return true;
    });
}

result_void adaptation_engine::validate_start() {
    if (!config_.validate()) {
        return make_void_error(vsm_error_code::invalid_configuration,
                               "Invalid adaptation engine configuration");
    }
    return make_void_success();
}

} // namespace kcenon::vsm
