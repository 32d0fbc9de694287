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
 * @file test_feature_extractor.cpp
 * @brief Normalization, segmentation and per-kind feature extraction
 */

#include <gtest/gtest.h>
#include <kcenon/vsm/pattern/feature_extractor.h>
#include <kcenon/vsm/pattern/similarity_metric.h>

#include <cmath>
#include <vector>

using namespace kcenon::vsm;

namespace {

std::vector<double> sine_wave(size_t length, double period) {
    std::vector<double> values(length);
    for (size_t i = 0; i < length; ++i) {
        values[i] = std::sin(2.0 * 3.14159265358979323846 * static_cast<double>(i) / period);
    }
    return values;
}

} // namespace

class FeatureExtractorTest : public ::testing::Test {};

// =========================================================================
// Normalization and Segmentation
// =========================================================================

TEST_F(FeatureExtractorTest, MinMaxNormalization) {
    auto normalized = normalize_stream({2.0, 4.0, 6.0});
    ASSERT_EQ(normalized.size(), 3u);
    EXPECT_DOUBLE_EQ(normalized[0], 0.0);
    EXPECT_DOUBLE_EQ(normalized[1], 0.5);
    EXPECT_DOUBLE_EQ(normalized[2], 1.0);
}

TEST_F(FeatureExtractorTest, ConstantStreamNormalizesToZeros) {
    auto normalized = normalize_stream(std::vector<double>(5, 7.0));
    EXPECT_EQ(normalized, std::vector<double>(5, 0.0));
    EXPECT_TRUE(normalize_stream({}).empty());
}

TEST_F(FeatureExtractorTest, OverlappingWindowsEndAtLastSample) {
    std::vector<double> values(250, 1.0);
    auto segments = segment_stream(values, 100, 90);

    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].size(), 100u);
    EXPECT_EQ(segments[1].size(), 100u);
    EXPECT_EQ(segments[2].size(), 70u);
}

TEST_F(FeatureExtractorTest, ShortStreamIsOneSegment) {
    auto segments = segment_stream({1.0, 2.0, 3.0}, 100, 90);
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].size(), 3u);
}

// =========================================================================
// Feature Kinds
// =========================================================================

TEST_F(FeatureExtractorTest, StatisticalMoments) {
    auto features = extract_statistical({1.0, 2.0, 3.0, 4.0, 5.0});
    EXPECT_DOUBLE_EQ(features.mean, 3.0);
    EXPECT_DOUBLE_EQ(features.variance, 2.0);
    EXPECT_NEAR(features.skewness, 0.0, 1e-12);
}

TEST_F(FeatureExtractorTest, PureToneHasSingleDominantFrequency) {
    auto features = extract_frequency(sine_wave(100, 10.0));
    EXPECT_NEAR(features.dominant_frequency, 0.1, 1e-9);
    EXPECT_LT(features.spectral_entropy, 1e-6);
}

TEST_F(FeatureExtractorTest, FlatSpectrumHasFullEntropy) {
    auto features = extract_frequency(std::vector<double>(16, 0.3));
    EXPECT_DOUBLE_EQ(features.dominant_frequency, 0.0);
    EXPECT_DOUBLE_EQ(features.spectral_entropy, 1.0);
}

TEST_F(FeatureExtractorTest, TwoSampleSegmentHasOneBin) {
    auto features = extract_frequency({0.0, 1.0});
    EXPECT_DOUBLE_EQ(features.dominant_frequency, 0.5);
    EXPECT_DOUBLE_EQ(features.spectral_entropy, 0.0);
}

TEST_F(FeatureExtractorTest, StructuralComplexityAndRegularity) {
    auto alternating = extract_structural({0.0, 1.0, 0.0, 1.0});
    EXPECT_DOUBLE_EQ(alternating.complexity, 0.5);
    EXPECT_NEAR(alternating.regularity, std::exp(-24.0 / 27.0), 1e-12);

    auto ramp = extract_structural({0.0, 0.25, 0.5, 0.75});
    EXPECT_DOUBLE_EQ(ramp.complexity, 1.0);
    EXPECT_DOUBLE_EQ(ramp.regularity, 1.0);
}

TEST_F(FeatureExtractorTest, SpatialCentroidAndDispersion) {
    auto features = extract_spatial({{0.0, 0.0}, {2.0, 0.0}});
    EXPECT_DOUBLE_EQ(features.centroid_x, 1.0);
    EXPECT_DOUBLE_EQ(features.centroid_y, 0.0);
    EXPECT_DOUBLE_EQ(features.dispersion, 1.0);
}

TEST_F(FeatureExtractorTest, BehavioralSignature) {
    auto features = extract_behavioral({"buy", "buy", "sell", "hold"});
    EXPECT_DOUBLE_EQ(features.distinct_ratio, 0.75);
    EXPECT_DOUBLE_EQ(features.dominant_share, 0.5);
}

TEST_F(FeatureExtractorTest, FeatureStrengthPerKind) {
    EXPECT_DOUBLE_EQ(feature_strength(statistical_features{0.5, 1.0, 0.0, 0.0}), 0.5);
    EXPECT_DOUBLE_EQ(feature_strength(frequency_features{0.1, 0.25}), 0.75);
    EXPECT_DOUBLE_EQ(feature_strength(structural_features{0.5, 0.6}), 0.6);
    EXPECT_DOUBLE_EQ(feature_strength(spatial_features{0.0, 0.0, 3.0}), 0.25);
    EXPECT_DOUBLE_EQ(feature_strength(behavioral_features{0.2, 0.9}), 0.9);
}

// =========================================================================
// Extractor
// =========================================================================

TEST_F(FeatureExtractorTest, ExtractorEmitsKindsPerSegment) {
    feature_extractor extractor(100, 90);
    observation_batch batch;
    batch.values = sine_wave(250, 10.0);
    batch.positions = {{0.0, 0.0}, {1.0, 1.0}};
    batch.behaviors = {"a", "b"};

    auto features = extractor.extract(batch);
    // 3 segments x (statistical, frequency, structural) + spatial + behavioral
    ASSERT_EQ(features.size(), 11u);
    EXPECT_EQ(features.back().kind(), feature_kind::behavioral_signature);
    for (const auto& f : features) {
        EXPECT_GE(f.strength, 0.0);
        EXPECT_LE(f.strength, 1.0);
    }
}

TEST_F(FeatureExtractorTest, SingleSampleSegmentSkipsFrequency) {
    feature_extractor extractor(100, 90);
    observation_batch batch;
    batch.values = {0.4};

    auto features = extractor.extract(batch);
    ASSERT_EQ(features.size(), 2u);
    EXPECT_EQ(features[0].kind(), feature_kind::statistical);
    EXPECT_EQ(features[1].kind(), feature_kind::structural);
}

TEST_F(FeatureExtractorTest, SnapshotFlattensToStrengthsAndImpactWeights) {
    signal_snapshot snapshot;
    snapshot.market_signals = {{"demand", 0.7, "sales"}};
    snapshot.technology_trends = {{"ai", impact_level::high, "6_months"}};
    snapshot.regulatory_updates = {{"privacy", "proposed", impact_level::low}};
    snapshot.competitive_moves = {{"rival", "launch", impact_level::medium}};

    EXPECT_EQ(snapshot_to_stream(snapshot), (std::vector<double>{0.7, 0.9, 0.2, 0.5}));
}

// =========================================================================
// Similarity
// =========================================================================

TEST_F(FeatureExtractorTest, SimilarityOfIdenticalPatternsIsOne) {
    feature_distance_similarity metric;
    pattern a;
    a.type = pattern_type::structural;
    a.features.push_back(feature{structural_features{0.5, 0.5}});
    pattern b = a;

    EXPECT_DOUBLE_EQ(metric.similarity(a, b), 1.0);

    b.type = pattern_type::temporal;
    EXPECT_DOUBLE_EQ(metric.similarity(a, b), 0.5);
}

TEST_F(FeatureExtractorTest, SimilarityWithoutSharedKindsIsZero) {
    feature_distance_similarity metric;
    pattern a;
    a.features.push_back(feature{structural_features{0.5, 0.5}});
    pattern b;
    b.features.push_back(feature{statistical_features{0.5, 0.1, 0.0, 0.0}});

    EXPECT_DOUBLE_EQ(metric.similarity(a, b), 0.0);
}

TEST_F(FeatureExtractorTest, SimilarityDecaysWithDistance) {
    feature_distance_similarity metric;
    pattern a;
    a.features.push_back(feature{structural_features{0.0, 0.0}});
    pattern b;
    b.features.push_back(feature{structural_features{0.3, 0.4}});

    EXPECT_NEAR(metric.similarity(a, b), std::exp(-0.5), 1e-12);
    EXPECT_DOUBLE_EQ(metric.similarity(a, b), metric.similarity(b, a));
}
