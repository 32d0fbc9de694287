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

#include "kcenon/vsm/pattern/similarity_metric.h"

#include <cmath>
#include <map>
#include <vector>

namespace kcenon::vsm {

namespace {

using kind_means = std::map<feature_kind, std::vector<double>>;

kind_means mean_vectors(const pattern& p) {
    kind_means sums;
    std::map<feature_kind, size_t> counts;
    for (const auto& f : p.features) {
        auto components = f.components();
        auto& sum = sums[f.kind()];
        if (sum.empty()) {
            sum.assign(components.size(), 0.0);
        }
        for (size_t i = 0; i < components.size() && i < sum.size(); ++i) {
            sum[i] += components[i];
        }
        counts[f.kind()]++;
    }
    for (auto& [kind, sum] : sums) {
        for (auto& v : sum) {
            v /= static_cast<double>(counts[kind]);
        }
    }
    return sums;
}

} // namespace

double feature_distance_similarity::similarity(const pattern& a, const pattern& b) const {
    const auto means_a = mean_vectors(a);
    const auto means_b = mean_vectors(b);

    bool shared = false;
    double squared = 0.0;
    for (const auto& [kind, va] : means_a) {
        auto it = means_b.find(kind);
        if (it == means_b.end()) {
            continue;
        }
        shared = true;
        const auto& vb = it->second;
        for (size_t i = 0; i < va.size() && i < vb.size(); ++i) {
            const double d = va[i] - vb[i];
            squared += d * d;
        }
    }
    if (!shared) {
        return 0.0;
    }

    double result = std::exp(-std::sqrt(squared));
    if (a.type != b.type) {
        result *= 0.5;
    }
    return result;
}

} // namespace kcenon::vsm
