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
 * @file adaptation_models.h
 * @brief Incremental, transformational and defensive adaptation models
 *
 * Each model maps a challenge to actions, an impact estimate, resource
 * requirements, a timeline and risks. The functions are deterministic.
 */

#include <chrono>
#include <string>
#include <vector>

#include "adaptation_types.h"

namespace kcenon::vsm {

/**
 * @brief high -> defensive, medium -> incremental, low -> transformational
 */
adaptation_model_type select_model(challenge_urgency urgency) noexcept;

std::vector<std::string> model_actions(adaptation_model_type model, const challenge& c);

/**
 * @brief 0.25 incremental, 0.7 transformational, 0.35 defensive
 */
double model_impact(adaptation_model_type model) noexcept;

resource_requirements model_resources(adaptation_model_type model);

std::string model_timeline(adaptation_model_type model);

std::vector<std::string> model_risks(adaptation_model_type model);

/**
 * @brief Fill every model-derived field of a proposal for @p c
 *
 * The id and creation time are left to the caller.
 */
adaptation_proposal build_proposal(const challenge& c);

/**
 * @brief Expected duration of a timeline label
 *
 * Accepts 1_week, 2_weeks, 1_month, 2_months, 3_months, 6_months or a
 * positive number of seconds. Anything else resolves to one month.
 */
std::chrono::seconds estimate_duration(const std::string& timeline);

} // namespace kcenon::vsm
