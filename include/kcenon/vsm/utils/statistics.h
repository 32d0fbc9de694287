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

/**
 * @file statistics.h
 * @brief Descriptive statistics over sample vectors
 *
 * Population moments used by feature extraction, trend detection and
 * stability scoring. Every function returns 0 for an empty input.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <type_traits>
#include <vector>

namespace kcenon {
namespace vsm {
namespace stats {

/**
 * @struct moments
 * @brief First four population moments of a sample
 */
struct moments {
    double mean{0.0};
    double variance{0.0};
    double skewness{0.0};
    double kurtosis{0.0};  ///< Excess kurtosis
    size_t count{0};
};

namespace detail {

template <typename T>
double as_double(const T& value) {
    static_assert(std::is_arithmetic_v<T>, "statistics require arithmetic values");
    return static_cast<double>(value);
}

/**
 * Mean of the values shifted by the first element. Deviations taken against
 * the shifted data are exactly 0 for a constant list.
 */
template <typename T>
double shifted_mean(const std::vector<T>& values, double shift) {
    double total = 0.0;
    for (const auto& v : values) {
        total += as_double(v) - shift;
    }
    return total / static_cast<double>(values.size());
}

}  // namespace detail

/**
 * @brief Arithmetic mean
 */
template <typename T>
double mean(const std::vector<T>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& v : values) {
        total += detail::as_double(v);
    }
    return total / static_cast<double>(values.size());
}

/**
 * @brief Population variance
 *
 * @example
 * @code
 * std::vector<double> values = {1.0, 2.0, 3.0, 4.0, 5.0};
 * double v = variance(values);  // 2.0
 * @endcode
 */
template <typename T>
double variance(const std::vector<T>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double shift = detail::as_double(values.front());
    const double m = detail::shifted_mean(values, shift);
    double sum_sq = 0.0;
    for (const auto& v : values) {
        const double d = (detail::as_double(v) - shift) - m;
        sum_sq += d * d;
    }
    return sum_sq / static_cast<double>(values.size());
}

/**
 * @brief Compute mean, variance, skewness and excess kurtosis in one pass
 *
 * Skewness and kurtosis are 0 when the variance is 0.
 */
template <typename T>
moments compute_moments(const std::vector<T>& values) {
    moments result;
    result.count = values.size();
    if (values.empty()) {
        return result;
    }

    result.mean = mean(values);

    const double shift = detail::as_double(values.front());
    const double shifted = detail::shifted_mean(values, shift);
    double m2 = 0.0;
    double m3 = 0.0;
    double m4 = 0.0;
    for (const auto& v : values) {
        const double d = (detail::as_double(v) - shift) - shifted;
        const double d2 = d * d;
        m2 += d2;
        m3 += d2 * d;
        m4 += d2 * d2;
    }
    const double n = static_cast<double>(values.size());
    m2 /= n;
    m3 /= n;
    m4 /= n;

    result.variance = m2;
    if (m2 > 0.0) {
        result.skewness = m3 / std::pow(m2, 1.5);
        result.kurtosis = m4 / (m2 * m2) - 3.0;
    }
    return result;
}

/**
 * @brief Least-squares slope of values against their index
 * @return Change per index step, 0 for fewer than two samples
 */
template <typename T>
double linear_slope(const std::vector<T>& values) {
    const size_t n = values.size();
    if (n < 2) {
        return 0.0;
    }
    const double x_mean = static_cast<double>(n - 1) / 2.0;
    const double y_mean = mean(values);
    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        num += dx * (detail::as_double(values[i]) - y_mean);
        den += dx * dx;
    }
    return den > 0.0 ? num / den : 0.0;
}

/**
 * @brief Copy of the last @p n elements (or all when fewer)
 */
template <typename T>
std::vector<T> tail(const std::vector<T>& values, size_t n) {
    if (values.size() <= n) {
        return values;
    }
    return std::vector<T>(values.end() - static_cast<std::ptrdiff_t>(n), values.end());
}

}  // namespace stats
}  // namespace vsm
}  // namespace kcenon
