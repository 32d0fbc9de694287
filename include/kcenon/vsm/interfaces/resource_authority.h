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
 * @file resource_authority.h
 * @brief Collaborator that allocates capacity for adaptations
 */

#include <memory>
#include <string>

#include "../core/result_types.h"
#include "../core/service_unit.h"
#include "../adaptation/adaptation_types.h"
#include "../variety/variety_types.h"

namespace kcenon::vsm {

/**
 * @class resource_authority
 * @brief Allocation and load redistribution across operational units
 */
class resource_authority {
public:
    virtual ~resource_authority() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Allocate resources for an accepted adaptation
     * @return Error (usually resource_denied) when the allocation is refused
     */
    virtual result_void allocate_for_adaptation(const adaptation_proposal& proposal) = 0;

    /**
     * @brief Rebalance variety load after an explosion threat
     */
    virtual result_void redistribute_variety(const risk_report& explosion_data) = 0;
};

/**
 * @class log_resource_authority
 * @brief Resource authority that grants every request and logs it
 */
class log_resource_authority : public resource_authority {
public:
    explicit log_resource_authority(logger_ptr logger = nullptr,
                                    std::string authority_name = "log_resource_authority")
        : logger_(std::move(logger)), name_(std::move(authority_name)) {}

    std::string name() const override { return name_; }

    result_void allocate_for_adaptation(const adaptation_proposal& proposal) override;
    result_void redistribute_variety(const risk_report& explosion_data) override;

private:
    logger_ptr logger_;
    std::string name_;
};

} // namespace kcenon::vsm
