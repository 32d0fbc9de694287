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

#include "kcenon/vsm/interfaces/policy_authority.h"
#include "kcenon/vsm/interfaces/resource_authority.h"

#include <sstream>

namespace kcenon::vsm {

// ========== log_policy_authority Implementation ==========

result_void log_policy_authority::write(log_level level, const std::string& message) const {
    if (!logger_) {
        return make_void_success();
    }
    return logger_->log(level, "[" + name_ + "] " + message);
}

result_void log_policy_authority::approve_adaptation(const adaptation_proposal& proposal) {
    std::ostringstream oss;
    oss << "[APPROVAL] " << proposal.id << " (" << to_string(proposal.model_type)
        << ") for " << to_string(proposal.source_challenge.type)
        << " | impact: " << proposal.impact
        << " | timeline: " << proposal.timeline;
    return write(log_level::info, oss.str());
}

result_void log_policy_authority::spawn_meta_system_emergency(
    const meta_system_spawn_request& request) {
    std::ostringstream oss;
    oss << "[META-SYSTEM] " << request.meta_system_type << " requested ("
        << request.reason << ", urgency " << request.urgency << ")"
        << " | variety: " << request.variety_level
        << " | ratio: " << request.variety_ratio;
    return write(log_level::warning, oss.str());
}

result_void log_policy_authority::handle_cascade_risk(const cascade_risk_report& report) {
    std::ostringstream oss;
    oss << "[CASCADE] " << report.prediction.cascade_stages.size() << " stages predicted"
        << " | containment: " << report.prediction.containment_probability
        << " | recommended: " << report.recommended_action;
    return write(log_level::warning, oss.str());
}

result_void log_policy_authority::handle_pattern_emergence(const pattern_emergence_notice& notice) {
    std::ostringstream oss;
    oss << "[EMERGENCE] " << notice.emergent_ids.size() << " emergent patterns, "
        << notice.meta_pattern_count << " meta-patterns"
        << " | recommended: " << notice.recommended_action;
    return write(log_level::info, oss.str());
}

result_void log_policy_authority::propose_system_evolution(
    const system_evolution_proposal& proposal) {
    std::ostringstream oss;
    oss << "[EVOLUTION] " << to_string(proposal.recommended_evolution)
        << " (urgency " << to_string(proposal.urgency) << ")";
    return write(log_level::info, oss.str());
}

// ========== log_resource_authority Implementation ==========

result_void log_resource_authority::allocate_for_adaptation(const adaptation_proposal& proposal) {
    if (!logger_) {
        return make_void_success();
    }
    return logger_->log(log_level::info,
                        "[" + name_ + "] allocated " + proposal.resources_required.cost +
                        " cost / " + proposal.resources_required.time + " for " + proposal.id);
}

result_void log_resource_authority::redistribute_variety(const risk_report& explosion_data) {
    if (!logger_) {
        return make_void_success();
    }
    std::ostringstream oss;
    oss << "[" << name_ << "] redistributing variety load of " << explosion_data.external_variety;
    return logger_->log(log_level::info, oss.str());
}

} // namespace kcenon::vsm
