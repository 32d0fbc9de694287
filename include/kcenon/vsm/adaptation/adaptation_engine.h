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
 * @file adaptation_engine.h
 * @brief Proposal generation and tracking of active adaptations
 */

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "adaptation_models.h"
#include "adaptation_types.h"
#include "progress_probe.h"
#include "../config/intelligence_config.h"
#include "../core/service_unit.h"
#include "../interfaces/policy_authority.h"
#include "../interfaces/resource_authority.h"

namespace kcenon::vsm {

/**
 * @class adaptation_engine
 * @brief Turns challenges into proposals and follows approved adaptations
 *
 * Proposals go to the policy authority; approved ones come back through
 * implement_adaptation(). Each active adaptation is polled every
 * monitor_interval until its probe reports completion.
 *
 * @thread_safety All public methods are thread-safe.
 */
class adaptation_engine : public service_unit {
public:
    explicit adaptation_engine(const adaptation_engine_config& config = adaptation_engine_config{},
                               std::shared_ptr<policy_authority> policy = nullptr,
                               std::shared_ptr<resource_authority> resources = nullptr,
                               std::shared_ptr<progress_probe> probe = std::make_shared<elapsed_time_probe>(),
                               logger_ptr logger = nullptr);

    ~adaptation_engine() override;

    /**
     * @brief Build a proposal with the model selected by the challenge urgency
     */
    adaptation_proposal generate_proposal(const challenge& c);

    /**
     * @brief Begin an approved adaptation
     *
     * Returns immediately. A proposal whose id is already active is ignored.
     */
    void implement_adaptation(const adaptation_proposal& proposal);

    /**
     * @brief Run one monitoring tick for @p id
     * @return not_found when @p id is not active
     */
    result<adaptation_progress> poll_adaptation(const std::string& id);

    std::vector<adaptation> get_active_adaptations() const;

    std::vector<adaptation> get_adaptation_history() const;

    adaptation_metrics get_adaptation_metrics() const;

    /**
     * @brief Derive challenges from viability metrics and submit a proposal for each
     *
     * Returns immediately.
     */
    void request_proposals_for_viability(const viability_metrics& metrics);

    /**
     * @brief Generate a proposal for @p c and submit it for approval
     */
    result_void handle_adaptation_needed(const challenge& c);

    void set_policy_authority(std::shared_ptr<policy_authority> policy);

    void set_resource_authority(std::shared_ptr<resource_authority> resources);

    void set_progress_probe(std::shared_ptr<progress_probe> probe);

protected:
    result_void validate_start() override;

private:
    adaptation_proposal make_proposal(const challenge& c);
    result_void submit_for_approval(const adaptation_proposal& proposal);
    void schedule_poll(const std::string& id);
    adaptation_progress read_progress(const adaptation& active);
    result<adaptation_progress> tick(const std::string& id);
    void complete(const std::string& id, const adaptation_progress& outcome);

    adaptation_engine_config config_;
    std::shared_ptr<policy_authority> policy_;
    std::shared_ptr<resource_authority> resources_;
    std::shared_ptr<progress_probe> probe_;

    std::map<std::string, adaptation> active_;
    std::deque<adaptation> history_;
    adaptation_metrics metrics_;
    uint64_t next_sequence_{0};
};

} // namespace kcenon::vsm
