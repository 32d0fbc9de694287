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
 * @file feature_extractor.h
 * @brief Normalization, segmentation and per-segment feature extraction
 *
 * The free functions are pure and exposed for testing; feature_extractor
 * chains them into the detection pipeline front end.
 */

#include <string>
#include <utility>
#include <vector>

#include "pattern_types.h"
#include "../scanner/signal_types.h"

namespace kcenon::vsm {

/**
 * @brief Min-max normalize to [0, 1]
 *
 * A constant stream becomes all zeros.
 */
std::vector<double> normalize_stream(const std::vector<double>& values);

/**
 * @brief Split into windows of @p size starting every @p step samples
 *
 * The last window may be shorter; it always ends at the final sample.
 * A stream no longer than @p size yields a single window.
 */
std::vector<std::vector<double>> segment_stream(const std::vector<double>& values,
                                                size_t size, size_t step);

statistical_features extract_statistical(const std::vector<double>& segment);

/**
 * @brief Dominant frequency and normalized spectral entropy by DFT
 *
 * The DC bin is excluded. A segment without spectral power has entropy 1.
 */
frequency_features extract_frequency(const std::vector<double>& segment);

structural_features extract_structural(const std::vector<double>& segment);

spatial_features extract_spatial(const std::vector<std::pair<double, double>>& positions);

behavioral_features extract_behavioral(const std::vector<std::string>& behaviors);

/**
 * @brief Strength in [0, 1] of a feature record
 */
double feature_strength(const feature_values& values);

/**
 * @brief Flatten a snapshot into a numeric stream
 *
 * Market strengths are taken as-is; impact levels of the other families map
 * to low 0.2, medium 0.5 and high 0.9.
 */
std::vector<double> snapshot_to_stream(const signal_snapshot& snapshot);

/**
 * @class feature_extractor
 * @brief Turns an observation batch into typed feature records
 *
 * @example
 * @code
 * feature_extractor extractor(100, 90);
 * auto features = extractor.extract(observation_batch{values, {}, {}});
 * @endcode
 */
class feature_extractor {
public:
    feature_extractor(size_t segment_size = 100, size_t segment_step = 90);

    std::vector<feature> extract(const observation_batch& batch) const;

    size_t segment_size() const { return segment_size_; }

private:
    size_t segment_size_;
    size_t segment_step_;
};

} // namespace kcenon::vsm
