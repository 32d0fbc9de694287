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
 * @file policy_authority.h
 * @brief Collaborator that approves adaptations and spawns control instances
 *
 * The intelligence layer only ever calls into the policy authority; its
 * decisions come back through the adaptation engine's implement_adaptation.
 */

#include <memory>
#include <string>

#include "../core/result_types.h"
#include "../core/service_unit.h"
#include "../adaptation/adaptation_types.h"
#include "../pattern/pattern_types.h"
#include "../variety/variety_types.h"

namespace kcenon::vsm {

/**
 * @class policy_authority
 * @brief Decisions whose scope exceeds the intelligence layer
 *
 * Every method is a submission: a successful result means the authority
 * accepted the request for consideration, not that it acted on it.
 */
class policy_authority {
public:
    virtual ~policy_authority() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Submit an adaptation proposal for approval or veto
     */
    virtual result_void approve_adaptation(const adaptation_proposal& proposal) = 0;

    /**
     * @brief Request an emergency meta-system to absorb excess variety
     */
    virtual result_void spawn_meta_system_emergency(const meta_system_spawn_request& request) = 0;

    /**
     * @brief Report a cascade that local absorption is unlikely to contain
     */
    virtual result_void handle_cascade_risk(const cascade_risk_report& report) = 0;

    /**
     * @brief Report emergence beyond what the detector handles locally
     */
    virtual result_void handle_pattern_emergence(const pattern_emergence_notice& notice) = 0;

    /**
     * @brief Propose structural evolution derived from meta-patterns
     */
    virtual result_void propose_system_evolution(const system_evolution_proposal& proposal) = 0;
};

/**
 * @class log_policy_authority
 * @brief Policy authority that records submissions in the log only
 *
 * Used when no real authority is wired in.
 */
class log_policy_authority : public policy_authority {
public:
    explicit log_policy_authority(logger_ptr logger = nullptr,
                                  std::string authority_name = "log_policy_authority")
        : logger_(std::move(logger)), name_(std::move(authority_name)) {}

    std::string name() const override { return name_; }

    result_void approve_adaptation(const adaptation_proposal& proposal) override;
    result_void spawn_meta_system_emergency(const meta_system_spawn_request& request) override;
    result_void handle_cascade_risk(const cascade_risk_report& report) override;
    result_void handle_pattern_emergence(const pattern_emergence_notice& notice) override;
    result_void propose_system_evolution(const system_evolution_proposal& proposal) override;

private:
    result_void write(log_level level, const std::string& message) const;

    logger_ptr logger_;
    std::string name_;
};

} // namespace kcenon::vsm
