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

#include "kcenon/vsm/adaptation/progress_probe.h"
#include "kcenon/vsm/adaptation/adaptation_models.h"

#include <algorithm>

namespace kcenon::vsm {

result<adaptation_progress> elapsed_time_probe::probe(const adaptation& active,
                                                      std::chrono::system_clock::time_point now) {
    const auto expected = estimate_duration(active.proposal.timeline);
    const double elapsed = std::max(0.0, std::chrono::duration<double>(now - active.started_at).count());

    adaptation_progress reading;
    reading.progress = std::min(1.0, elapsed / static_cast<double>(expected.count()));
    reading.completed = reading.progress >= completion_threshold_;
    if (reading.completed) {
        reading.success = true;
        reading.efficiency_impact = active.proposal.impact;
        reading.effectiveness_impact = active.proposal.impact;
    }
    return make_success(reading);
}

} // namespace kcenon::vsm
