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
 * @file pattern_types.h
 * @brief Records produced and consumed by the pattern detector
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kcenon::vsm {

// ============================================================================
// Features
// ============================================================================

/**
 * @enum feature_kind
 * @brief Kind of a feature extracted from one input segment
 *
 * The order matches the alternatives of feature_values.
 */
enum class feature_kind {
    statistical,
    frequency,
    structural,
    spatial_distribution,
    behavioral_signature
};

constexpr const char* to_string(feature_kind kind) noexcept {
    switch (kind) {
        case feature_kind::statistical: return "statistical";
        case feature_kind::frequency: return "frequency";
        case feature_kind::structural: return "structural";
        case feature_kind::spatial_distribution: return "spatial_distribution";
        case feature_kind::behavioral_signature: return "behavioral_signature";
        default: return "unknown";
    }
}

struct statistical_features {
    double mean{0.0};
    double variance{0.0};
    double skewness{0.0};
    double kurtosis{0.0};
};

struct frequency_features {
    double dominant_frequency{0.0};   ///< Cycles per sample, (0, 0.5]
    double spectral_entropy{0.0};     ///< Normalized to [0, 1]
};

struct structural_features {
    double complexity{0.0};   ///< Unique values / length
    double regularity{0.0};   ///< exp(-variance of first differences)
};

struct spatial_features {
    double centroid_x{0.0};
    double centroid_y{0.0};
    double dispersion{0.0};
};

struct behavioral_features {
    double distinct_ratio{0.0};
    double dominant_share{0.0};
};

using feature_values = std::variant<statistical_features,
                                    frequency_features,
                                    structural_features,
                                    spatial_features,
                                    behavioral_features>;

/**
 * @struct feature
 * @brief One typed feature record with its strength in [0, 1]
 */
struct feature {
    feature_values values;
    double strength{0.5};
    size_t segment{0};

    feature_kind kind() const { return static_cast<feature_kind>(values.index()); }

    /**
     * @brief Numeric components in declaration order
     */
    std::vector<double> components() const;
};

/**
 * @struct observation_batch
 * @brief Raw input for pattern detection
 *
 * Positions act as spatial-distribution markers and behaviour tokens as
 * behavioural-signature markers; both are optional.
 */
struct observation_batch {
    std::vector<double> values;
    std::vector<std::pair<double, double>> positions;
    std::vector<std::string> behaviors;

    bool empty() const { return values.empty() && positions.empty() && behaviors.empty(); }
};

// ============================================================================
// Patterns
// ============================================================================

enum class pattern_type {
    behavioral,
    structural,
    temporal,
    spatial,
    quantum,
    meta
};

constexpr const char* to_string(pattern_type type) noexcept {
    switch (type) {
        case pattern_type::behavioral: return "behavioral";
        case pattern_type::structural: return "structural";
        case pattern_type::temporal: return "temporal";
        case pattern_type::spatial: return "spatial";
        case pattern_type::quantum: return "quantum";
        case pattern_type::meta: return "meta";
        default: return "unknown";
    }
}

/**
 * @struct pattern
 * @brief Immutable record of one detected pattern
 */
struct pattern {
    std::string id;
    std::vector<feature> features;
    pattern_type type{pattern_type::structural};
    double strength{0.5};
    double emergence_score{0.0};
    double scale{1.0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

enum class meta_pattern_type {
    temporal_hierarchy,
    spatial_hierarchy,
    behavioral_composition,
    cross_domain
};

constexpr const char* to_string(meta_pattern_type type) noexcept {
    switch (type) {
        case meta_pattern_type::temporal_hierarchy: return "temporal_hierarchy";
        case meta_pattern_type::spatial_hierarchy: return "spatial_hierarchy";
        case meta_pattern_type::behavioral_composition: return "behavioral_composition";
        case meta_pattern_type::cross_domain: return "cross_domain";
        default: return "unknown";
    }
}

/**
 * @struct meta_pattern
 * @brief Higher-order pattern formed by correlated patterns
 *
 * strength is always the mean of the component strengths times 0.9.
 */
struct meta_pattern {
    std::string id;
    std::vector<std::string> component_pattern_ids;
    meta_pattern_type meta_type{meta_pattern_type::cross_domain};
    double strength{0.0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct pattern_edge {
    std::string from;
    std::string to;
    double weight{0.0};
};

/**
 * @struct pattern_graph
 * @brief Relationship graph between the retained patterns
 */
struct pattern_graph {
    std::vector<std::string> nodes;
    std::vector<pattern_edge> edges;

    double complexity() const {
        return nodes.empty() ? 0.0
                             : static_cast<double>(edges.size()) / static_cast<double>(nodes.size());
    }
};

/**
 * @struct detection_result
 * @brief Outcome of one detection cycle
 */
struct detection_result {
    std::vector<pattern> patterns;
    std::vector<std::string> emergent_ids;
    std::vector<meta_pattern> meta_patterns;
    double emergence_score{0.0};
    double graph_complexity{0.0};
};

// ============================================================================
// Emergence analysis
// ============================================================================

enum class emergence_level { none, minimal, low, medium, high };

constexpr const char* to_string(emergence_level level) noexcept {
    switch (level) {
        case emergence_level::none: return "none";
        case emergence_level::minimal: return "minimal";
        case emergence_level::low: return "low";
        case emergence_level::medium: return "medium";
        case emergence_level::high: return "high";
        default: return "unknown";
    }
}

enum class interaction_kind { reinforcing, inhibiting, modulating, neutral };

constexpr const char* to_string(interaction_kind kind) noexcept {
    switch (kind) {
        case interaction_kind::reinforcing: return "reinforcing";
        case interaction_kind::inhibiting: return "inhibiting";
        case interaction_kind::modulating: return "modulating";
        case interaction_kind::neutral: return "neutral";
        default: return "unknown";
    }
}

struct pattern_interaction {
    std::string first_id;
    std::string second_id;
    interaction_kind kind{interaction_kind::neutral};
    double strength{0.0};   ///< Mean strength times correlation
};

enum class critical_point_type { emergence_critical, strength_critical, threshold_critical };

struct critical_point {
    std::string pattern_id;
    double criticality{0.0};
    critical_point_type type{critical_point_type::threshold_critical};
};

struct phase_transition {
    std::string phase;
    std::string next_phase;
    double probability{0.0};
};

/**
 * @struct emergence_event
 * @brief Recorded when an analyzed set shows strong emergence
 */
struct emergence_event {
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    emergence_level level{emergence_level::none};
    double mean_emergence{0.0};
    size_t pattern_count{0};
};

struct emergence_analysis {
    emergence_level level{emergence_level::none};
    double mean_emergence{0.0};
    std::vector<pattern_interaction> interactions;
    size_t strong_interactions{0};
    std::vector<critical_point> critical_points;
    std::vector<phase_transition> phase_transitions;
    double self_organization{0.0};
    double complexity_measure{0.0};
    double predictability{1.0};
};

// ============================================================================
// Evolution and trajectories
// ============================================================================

struct evolution_sample {
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    double strength{0.0};
    pattern_type type{pattern_type::structural};
    double emergence_score{0.0};
};

enum class mutation_kind { type_change, strength_shift };

struct pattern_mutation {
    size_t index{0};   ///< Position of the later sample in the history
    mutation_kind kind{mutation_kind::strength_shift};
    pattern_type from_type{pattern_type::structural};
    pattern_type to_type{pattern_type::structural};
    double strength_delta{0.0};
};

/**
 * @struct evolution_record
 * @brief Derived view over the evolution history of one pattern
 */
struct evolution_record {
    std::string pattern_id;
    std::vector<evolution_sample> history;
    std::vector<double> trajectory;   ///< Projected strengths, 5 steps ahead
    std::vector<pattern_mutation> mutations;
    double stability{1.0};
};

struct predicted_state {
    int step{0};
    int64_t offset_ms{0};
    double strength{0.0};
    double confidence{0.0};
};

enum class bifurcation_kind { critical_threshold, extreme_value };

struct bifurcation_point {
    int64_t offset_ms{0};
    bifurcation_kind kind{bifurcation_kind::critical_threshold};
    double strength{0.0};
};

enum class attractor_kind { strong, weak, neutral };

struct attractor_state {
    double value{0.0};
    size_t basin_size{0};
    attractor_kind kind{attractor_kind::neutral};
};

struct trajectory_prediction {
    std::string pattern_id;
    std::vector<predicted_state> predicted_states;
    double confidence{0.0};
    std::vector<bifurcation_point> bifurcation_points;
    std::vector<attractor_state> attractor_states;
};

// ============================================================================
// Meta-pattern analysis
// ============================================================================

struct recursive_structure {
    std::string first_id;
    std::string second_id;
    pattern_type type{pattern_type::structural};
    double similarity{0.0};
    double depth{0.0};
};

struct pattern_of_patterns {
    std::optional<pattern_type> dominant_type;
    std::map<pattern_type, size_t> distribution;
    double meta_regularity{0.0};
    double meta_complexity{0.0};
};

enum class hierarchy_level { dominant, intermediate, subordinate, weak };

struct emergent_hierarchy {
    std::map<hierarchy_level, std::vector<std::string>> levels;
    size_t depth{0};
    double balance{0.0};
};

enum class scale_band { micro, meso, macro };

constexpr const char* to_string(scale_band band) noexcept {
    switch (band) {
        case scale_band::micro: return "micro";
        case scale_band::meso: return "meso";
        case scale_band::macro: return "macro";
        default: return "unknown";
    }
}

struct scale_comparison {
    scale_band first{scale_band::micro};
    scale_band second{scale_band::micro};
    double similarity{0.0};
    bool self_similar{false};
};

struct self_similarity_analysis {
    std::vector<scale_comparison> comparisons;
    double index{0.0};
    double fractal_dimension{1.0};
};

struct universal_pattern_analysis {
    std::vector<std::string> pattern_ids;
    double universality_index{0.0};
    std::optional<std::string> dominant_id;
};

enum class evolution_kind {
    recursive_expansion,
    hierarchical_restructuring,
    fractal_evolution,
    universal_integration,
    adaptive_evolution
};

constexpr const char* to_string(evolution_kind kind) noexcept {
    switch (kind) {
        case evolution_kind::recursive_expansion: return "recursive_expansion";
        case evolution_kind::hierarchical_restructuring: return "hierarchical_restructuring";
        case evolution_kind::fractal_evolution: return "fractal_evolution";
        case evolution_kind::universal_integration: return "universal_integration";
        case evolution_kind::adaptive_evolution: return "adaptive_evolution";
        default: return "unknown";
    }
}

enum class escalation_urgency { low, medium, high, critical };

constexpr const char* to_string(escalation_urgency urgency) noexcept {
    switch (urgency) {
        case escalation_urgency::low: return "low";
        case escalation_urgency::medium: return "medium";
        case escalation_urgency::high: return "high";
        case escalation_urgency::critical: return "critical";
        default: return "unknown";
    }
}

struct meta_pattern_analysis {
    std::vector<recursive_structure> recursive_structures;
    pattern_of_patterns patterns_of_patterns;
    emergent_hierarchy hierarchy;
    self_similarity_analysis self_similarity;
    universal_pattern_analysis universal_patterns;
    bool evolution_recommended{false};
    evolution_kind recommended_evolution{evolution_kind::adaptive_evolution};
    escalation_urgency urgency{escalation_urgency::low};
};

// ============================================================================
// Escalations and state
// ============================================================================

/**
 * @struct pattern_emergence_notice
 * @brief Sent to the policy authority when emergence exceeds local handling
 */
struct pattern_emergence_notice {
    std::vector<std::string> emergent_ids;
    size_t meta_pattern_count{0};
    double emergence_score{0.0};
    std::string recommended_action{"spawn_pattern_handler"};
};

/**
 * @struct system_evolution_proposal
 * @brief Structural evolution proposed from meta-pattern analysis
 */
struct system_evolution_proposal {
    std::string reason{"meta_pattern_emergence"};
    evolution_kind recommended_evolution{evolution_kind::adaptive_evolution};
    escalation_urgency urgency{escalation_urgency::low};
    size_t recursive_structures{0};
    size_t hierarchy_depth{0};
    double self_similarity_index{0.0};
    double universality_index{0.0};
};

struct pattern_metrics {
    uint64_t total_detected{0};
    double emergence_rate{0.0};
    double stability_index{0.85};
    uint64_t meta_pattern_count{0};
    double prediction_accuracy{0.0};
};

struct pattern_state {
    size_t total_patterns{0};
    size_t meta_patterns{0};
    size_t evolving_patterns{0};
    size_t emergence_events{0};
    size_t graph_nodes{0};
    size_t graph_edges{0};
    size_t buffered_batches{0};
    pattern_metrics metrics;
};

} // namespace kcenon::vsm
