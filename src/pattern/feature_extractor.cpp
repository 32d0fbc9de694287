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

#include "kcenon/vsm/pattern/feature_extractor.h"
#include "kcenon/vsm/utils/statistics.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <type_traits>
#include <variant>

namespace kcenon::vsm {

namespace {

constexpr double pi = 3.14159265358979323846;

double clamp_unit(double value) {
    return std::clamp(value, 0.0, 1.0);
}

} // namespace

// ========== feature Implementation ==========

std::vector<double> feature::components() const {
    return std::visit([](const auto& v) -> std::vector<double> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, statistical_features>) {
            return {v.mean, v.variance, v.skewness, v.kurtosis};
        } else if constexpr (std::is_same_v<T, frequency_features>) {
            return {v.dominant_frequency, v.spectral_entropy};
        } else if constexpr (std::is_same_v<T, structural_features>) {
            return {v.complexity, v.regularity};
        } else if constexpr (std::is_same_v<T, spatial_features>) {
            return {v.centroid_x, v.centroid_y, v.dispersion};
        } else {
            return {v.distinct_ratio, v.dominant_share};
        }
    }, values);
}

// ========== Pipeline stages ==========

std::vector<double> normalize_stream(const std::vector<double>& values) {
    if (values.empty()) {
        return {};
    }
    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    const double lo = *min_it;
    const double range = *max_it - lo;

    std::vector<double> normalized(values.size(), 0.0);
    if (range <= 0.0) {
        return normalized;
    }
    for (size_t i = 0; i < values.size(); ++i) {
        normalized[i] = (values[i] - lo) / range;
    }
    return normalized;
}

std::vector<std::vector<double>> segment_stream(const std::vector<double>& values,
                                                size_t size, size_t step) {
    std::vector<std::vector<double>> segments;
    if (values.empty() || size == 0 || step == 0) {
        return segments;
    }

    for (size_t start = 0; start < values.size(); start += step) {
        const size_t end = std::min(start + size, values.size());
        segments.emplace_back(values.begin() + static_cast<std::ptrdiff_t>(start),
                              values.begin() + static_cast<std::ptrdiff_t>(end));
        if (end == values.size()) {
            break;
        }
    }
    return segments;
}

statistical_features extract_statistical(const std::vector<double>& segment) {
    auto m = stats::compute_moments(segment);
    return statistical_features{m.mean, m.variance, m.skewness, m.kurtosis};
}

frequency_features extract_frequency(const std::vector<double>& segment) {
    frequency_features result;
    result.spectral_entropy = 1.0;

    const size_t n = segment.size();
    const size_t bins = n / 2;
    if (bins == 0) {
        return result;
    }

    const double m = stats::mean(segment);
    std::vector<double> power(bins, 0.0);
    for (size_t k = 1; k <= bins; ++k) {
        double re = 0.0;
        double im = 0.0;
        for (size_t t = 0; t < n; ++t) {
            const double angle = 2.0 * pi * static_cast<double>(k * t) / static_cast<double>(n);
            re += (segment[t] - m) * std::cos(angle);
            im -= (segment[t] - m) * std::sin(angle);
        }
        power[k - 1] = re * re + im * im;
    }

    const double total = std::accumulate(power.begin(), power.end(), 0.0);
    if (total <= 1e-12) {
        return result;
    }

    auto peak = std::max_element(power.begin(), power.end());
    result.dominant_frequency =
        static_cast<double>(std::distance(power.begin(), peak) + 1) / static_cast<double>(n);

    if (bins == 1) {
        result.spectral_entropy = 0.0;
        return result;
    }

    double entropy = 0.0;
    for (double p : power) {
        if (p > 0.0) {
            const double share = p / total;
            entropy -= share * std::log(share);
        }
    }
    result.spectral_entropy = clamp_unit(entropy / std::log(static_cast<double>(bins)));
    return result;
}

structural_features extract_structural(const std::vector<double>& segment) {
    structural_features result;
    if (segment.empty()) {
        return result;
    }

    std::set<double> unique(segment.begin(), segment.end());
    result.complexity = static_cast<double>(unique.size()) / static_cast<double>(segment.size());

    std::vector<double> diffs;
    diffs.reserve(segment.size());
    for (size_t i = 1; i < segment.size(); ++i) {
        diffs.push_back(segment[i] - segment[i - 1]);
    }
    result.regularity = std::exp(-stats::variance(diffs));
    return result;
}

spatial_features extract_spatial(const std::vector<std::pair<double, double>>& positions) {
    spatial_features result;
    if (positions.empty()) {
        return result;
    }

    for (const auto& [x, y] : positions) {
        result.centroid_x += x;
        result.centroid_y += y;
    }
    const double n = static_cast<double>(positions.size());
    result.centroid_x /= n;
    result.centroid_y /= n;

    for (const auto& [x, y] : positions) {
        result.dispersion += std::hypot(x - result.centroid_x, y - result.centroid_y);
    }
    result.dispersion /= n;
    return result;
}

behavioral_features extract_behavioral(const std::vector<std::string>& behaviors) {
    behavioral_features result;
    if (behaviors.empty()) {
        return result;
    }

    std::map<std::string, size_t> counts;
    for (const auto& b : behaviors) {
        counts[b]++;
    }
    size_t dominant = 0;
    for (const auto& [token, count] : counts) {
        dominant = std::max(dominant, count);
    }

    const double n = static_cast<double>(behaviors.size());
    result.distinct_ratio = static_cast<double>(counts.size()) / n;
    result.dominant_share = static_cast<double>(dominant) / n;
    return result;
}

double feature_strength(const feature_values& values) {
    return std::visit([](const auto& v) -> double {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, statistical_features>) {
            return 1.0 / (1.0 + v.variance);
        } else if constexpr (std::is_same_v<T, frequency_features>) {
            return clamp_unit(1.0 - v.spectral_entropy);
        } else if constexpr (std::is_same_v<T, structural_features>) {
            return clamp_unit(v.regularity);
        } else if constexpr (std::is_same_v<T, spatial_features>) {
            return 1.0 / (1.0 + v.dispersion);
        } else {
            return clamp_unit(v.dominant_share);
        }
    }, values);
}

std::vector<double> snapshot_to_stream(const signal_snapshot& snapshot) {
    std::vector<double> stream;
    stream.reserve(snapshot.signal_count());
    for (const auto& s : snapshot.market_signals) {
        stream.push_back(s.strength);
    }
    for (const auto& t : snapshot.technology_trends) {
        stream.push_back(impact_weight(t.impact));
    }
    for (const auto& r : snapshot.regulatory_updates) {
        stream.push_back(impact_weight(r.impact));
    }
    for (const auto& c : snapshot.competitive_moves) {
        stream.push_back(impact_weight(c.threat_level));
    }
    return stream;
}

// ========== feature_extractor Implementation ==========

feature_extractor::feature_extractor(size_t segment_size, size_t segment_step)
    : segment_size_(segment_size), segment_step_(segment_step) {}

std::vector<feature> feature_extractor::extract(const observation_batch& batch) const {
    std::vector<feature> features;

    auto segments = segment_stream(normalize_stream(batch.values), segment_size_, segment_step_);
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];

        feature statistical{extract_statistical(segment)};
        statistical.segment = i;
        features.push_back(statistical);

        // Fewer than two samples carry no spectrum.
        if (segment.size() >= 2) {
            feature frequency{extract_frequency(segment)};
            frequency.segment = i;
            features.push_back(frequency);
        }

        feature structural{extract_structural(segment)};
        structural.segment = i;
        features.push_back(structural);
    }

    if (!batch.positions.empty()) {
        features.push_back(feature{extract_spatial(batch.positions)});
    }
    if (!batch.behaviors.empty()) {
        features.push_back(feature{extract_behavioral(batch.behaviors)});
    }

    for (auto& f : features) {
        f.strength = feature_strength(f.values);
    }
    return features;
}

} // namespace kcenon::vsm
