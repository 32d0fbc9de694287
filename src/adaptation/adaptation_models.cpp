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

#include "kcenon/vsm/adaptation/adaptation_models.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace kcenon::vsm {

namespace {

constexpr int64_t day_seconds = 24 * 60 * 60;

} // namespace

adaptation_model_type select_model(challenge_urgency urgency) noexcept {
    switch (urgency) {
        case challenge_urgency::high: return adaptation_model_type::defensive;
        case challenge_urgency::low: return adaptation_model_type::transformational;
        default: return adaptation_model_type::incremental;
    }
}

std::vector<std::string> model_actions(adaptation_model_type model, const challenge& c) {
    std::vector<std::string> actions;
    switch (model) {
        case adaptation_model_type::incremental:
            if (c.type == challenge_type::efficiency) {
                actions.push_back("streamline_operations");
            }
            actions.push_back("optimize_processes");
            actions.push_back("enhance_features");
            break;
        case adaptation_model_type::transformational:
            if (c.type == challenge_type::market_shift) {
                actions.push_back("pivot_strategy");
            } else if (c.type == challenge_type::technology_disruption) {
                actions.push_back("adopt_new_tech");
            }
            actions.push_back("restructure_operations");
            actions.push_back("new_capabilities");
            break;
        case adaptation_model_type::defensive:
            if (c.type == challenge_type::health) {
                actions.push_back("emergency_stabilization");
            }
            actions.push_back("strengthen_core");
            actions.push_back("reduce_exposure");
            break;
    }
    return actions;
}

double model_impact(adaptation_model_type model) noexcept {
    switch (model) {
        case adaptation_model_type::transformational: return 0.7;
        case adaptation_model_type::defensive: return 0.35;
        default: return 0.25;
    }
}

resource_requirements model_resources(adaptation_model_type model) {
    switch (model) {
        case adaptation_model_type::transformational: return {"3_months", "high"};
        case adaptation_model_type::defensive: return {"1_month", "medium"};
        default: return {"2_weeks", "low"};
    }
}

std::string model_timeline(adaptation_model_type model) {
    switch (model) {
        case adaptation_model_type::transformational: return "6_months";
        case adaptation_model_type::defensive: return "2_months";
        default: return "1_month";
    }
}

std::vector<std::string> model_risks(adaptation_model_type model) {
    switch (model) {
        case adaptation_model_type::transformational:
            return {"disruption", "resistance", "resource_strain"};
        case adaptation_model_type::defensive:
            return {"opportunity_loss", "competitive_disadvantage"};
        default:
            return {"minimal_disruption"};
    }
}

adaptation_proposal build_proposal(const challenge& c) {
    adaptation_proposal proposal;
    proposal.source_challenge = c;
    proposal.model_type = select_model(c.urgency);
    proposal.actions = model_actions(proposal.model_type, c);
    proposal.impact = model_impact(proposal.model_type);
    proposal.resources_required = model_resources(proposal.model_type);
    proposal.timeline = model_timeline(proposal.model_type);
    proposal.risks = model_risks(proposal.model_type);
    return proposal;
}

std::chrono::seconds estimate_duration(const std::string& timeline) {
    if (timeline == "1_week") return std::chrono::seconds(7 * day_seconds);
    if (timeline == "2_weeks") return std::chrono::seconds(14 * day_seconds);
    if (timeline == "1_month") return std::chrono::seconds(30 * day_seconds);
    if (timeline == "2_months") return std::chrono::seconds(60 * day_seconds);
    if (timeline == "3_months") return std::chrono::seconds(90 * day_seconds);
    if (timeline == "6_months") return std::chrono::seconds(180 * day_seconds);

    if (!timeline.empty()) {
        errno = 0;
        char* end = nullptr;
        const double seconds = std::strtod(timeline.c_str(), &end);
        if (errno == 0 && end == timeline.c_str() + timeline.size() &&
            std::isfinite(seconds) && seconds > 0.0) {
            return std::chrono::seconds(std::max<int64_t>(1, std::llround(seconds)));
        }
    }
    return std::chrono::seconds(30 * day_seconds);
}

} // namespace kcenon::vsm
