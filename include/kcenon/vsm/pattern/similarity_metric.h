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
 * @file similarity_metric.h
 * @brief Pairwise similarity between patterns
 */

#include <string>

#include "pattern_types.h"

namespace kcenon::vsm {

/**
 * @class similarity_metric
 * @brief Symmetric similarity in [0, 1] between two patterns
 *
 * Used both for the emergence filter and as the pairwise correlation that
 * forms meta-patterns and graph edges. Implementations must be symmetric
 * and deterministic.
 */
class similarity_metric {
public:
    virtual ~similarity_metric() = default;

    virtual std::string name() const = 0;

    virtual double similarity(const pattern& a, const pattern& b) const = 0;
};

/**
 * @class feature_distance_similarity
 * @brief exp(-distance) between mean feature vectors
 *
 * For every feature kind present in both patterns, the mean component
 * vector of each pattern is taken; the Euclidean distance over all shared
 * components gives exp(-distance). Patterns without a shared kind have
 * similarity 0, and a pattern_type mismatch halves the result.
 */
class feature_distance_similarity : public similarity_metric {
public:
    std::string name() const override { return "feature_distance"; }

    double similarity(const pattern& a, const pattern& b) const override;
};

} // namespace kcenon::vsm
