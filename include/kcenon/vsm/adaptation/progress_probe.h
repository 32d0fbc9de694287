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
 * @file progress_probe.h
 * @brief Source of progress readings for active adaptations
 */

#include <chrono>
#include <string>

#include "adaptation_types.h"
#include "../core/result_types.h"

namespace kcenon::vsm {

/**
 * @class progress_probe
 * @brief Reports how far an active adaptation has progressed
 *
 * A reading with completed set also carries the confirmed outcome. Errors
 * and exceptions are treated by the engine as a zero-progress reading.
 */
class progress_probe {
public:
    virtual ~progress_probe() = default;

    virtual std::string name() const = 0;

    virtual result<adaptation_progress> probe(const adaptation& active,
                                              std::chrono::system_clock::time_point now) = 0;
};

/**
 * @class elapsed_time_probe
 * @brief Progress as elapsed time over the duration expected by the timeline
 *
 * Completes successfully once progress reaches the completion threshold.
 * Efficiency and effectiveness impacts equal the proposal impact.
 */
class elapsed_time_probe : public progress_probe {
public:
    explicit elapsed_time_probe(double completion_threshold = 0.9)
        : completion_threshold_(completion_threshold) {}

    std::string name() const override { return "elapsed_time_probe"; }

    result<adaptation_progress> probe(const adaptation& active,
                                      std::chrono::system_clock::time_point now) override;

private:
    double completion_threshold_;
};

} // namespace kcenon::vsm
