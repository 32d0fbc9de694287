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
 * @file pattern_detector.h
 * @brief Emergent and meta-pattern detection over signal streams
 *
 * The detector owns the pattern history, the relationship graph and the
 * per-pattern evolution lineages. Everything is mutated on the unit's
 * worker, one request or tick at a time.
 */

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "feature_extractor.h"
#include "pattern_types.h"
#include "similarity_metric.h"
#include "../config/intelligence_config.h"
#include "../core/service_unit.h"
#include "../interfaces/policy_authority.h"
#include "../scanner/signal_types.h"

namespace kcenon::vsm {

/**
 * @brief Pattern type implied by the kind of its feature cluster
 */
pattern_type classify_feature_kind(feature_kind kind) noexcept;

/**
 * @brief Meta-pattern type derived from the types of a correlated pair
 */
meta_pattern_type derive_meta_type(pattern_type a, pattern_type b) noexcept;

/**
 * @brief Bucket a mean emergence score
 *
 * >0.8 high, >0.5 medium, >0.2 low, else minimal.
 */
emergence_level bucket_emergence(double mean_emergence) noexcept;

/**
 * @brief Classify the interaction between two patterns
 */
interaction_kind classify_interaction(const pattern& a, const pattern& b) noexcept;

/**
 * @class pattern_detector
 * @brief Extracts features, flags emergence and links correlated patterns
 *
 * Input arrives either as a blocking detect_patterns() request or buffered
 * through submit_observations(), which the periodic analysis tick drains.
 *
 * @thread_safety All public methods are thread-safe.
 *
 * @example
 * @code
 * pattern_detector detector(pattern_detector_config{}, policy);
 * detector.start();
 * auto detection = detector.detect_patterns(std::vector<double>{0.1, 0.4, 0.9, 0.3});
 * for (const auto& id : detection.emergent_ids) {
 *     auto evolution = detector.track_evolution(id);
 * }
 * @endcode
 */
class pattern_detector : public service_unit {
public:
    explicit pattern_detector(const pattern_detector_config& config = pattern_detector_config{},
                              std::shared_ptr<policy_authority> policy = nullptr,
                              std::shared_ptr<similarity_metric> metric =
                                  std::make_shared<feature_distance_similarity>(),
                              logger_ptr logger = nullptr);

    ~pattern_detector() override;

    // ========== Detection ==========

    detection_result detect_patterns(const std::vector<double>& stream);

    detection_result detect_patterns(const observation_batch& batch);

    /**
     * @brief Detect over a snapshot flattened by snapshot_to_stream()
     */
    detection_result detect_patterns(const signal_snapshot& snapshot);

    /**
     * @brief Buffer observations for the periodic analysis tick
     */
    void submit_observations(observation_batch batch);

    // ========== Analysis ==========

    /**
     * @brief Characterize emergence in a set of patterns
     *
     * Records an emergence event when the mean emergence score exceeds the
     * configured threshold.
     */
    emergence_analysis analyze_emergence(const std::vector<pattern>& pattern_set);

    /**
     * @brief Evolution record of a stored pattern
     * @return not_found for an unknown id
     */
    result<evolution_record> track_evolution(const std::string& pattern_id);

    /**
     * @brief Forecast a pattern's strength in 100 ms steps
     * @return invalid_argument when @p horizon is not positive
     */
    result<trajectory_prediction> predict_pattern_trajectory(const pattern& target,
                                                             std::chrono::milliseconds horizon);

    /**
     * @brief Scan the stored pattern set for higher-order structure
     *
     * Proposes structural evolution to the policy authority when the
     * analysis recommends it.
     */
    meta_pattern_analysis identify_meta_patterns();

    // ========== State ==========

    pattern_state get_pattern_state() const;

    std::vector<pattern> get_patterns() const;

    result<pattern> get_pattern(const std::string& pattern_id) const;

    std::vector<meta_pattern> get_meta_patterns() const;

    pattern_graph get_pattern_graph() const;

    std::vector<emergence_event> get_emergence_events() const;

    void set_policy_authority(std::shared_ptr<policy_authority> policy);

protected:
    result_void validate_start() override;
    void on_started() override;

private:
    detection_result run_detection(const observation_batch& batch);
    std::vector<pattern> build_patterns(const observation_batch& batch);
    void store_pattern(const pattern& p);
    void evict_pattern(const std::string& pattern_id);
    void append_evolution(const std::string& pattern_id, const pattern& sample_source);
    std::vector<meta_pattern> form_meta_patterns(const std::vector<pattern>& fresh);
    void escalate_emergence(const detection_result& result, size_t new_meta_count);
    double lineage_stability(const std::string& pattern_id) const;
    const pattern* find_pattern(const std::string& pattern_id) const;
    void analyze_buffer();

    pattern_detector_config config_;
    feature_extractor extractor_;
    std::shared_ptr<policy_authority> policy_;
    std::shared_ptr<similarity_metric> metric_;

    std::deque<pattern> patterns_;
    std::map<std::string, std::deque<evolution_sample>> lineages_;
    std::vector<meta_pattern> meta_patterns_;
    std::set<std::pair<std::string, std::string>> linked_pairs_;
    pattern_graph graph_;
    std::deque<emergence_event> emergence_events_;
    std::deque<size_t> analyzed_set_sizes_;
    std::deque<observation_batch> buffer_;
    pattern_metrics metrics_;

    uint64_t next_pattern_id_{1};
    uint64_t next_meta_id_{1};
};

} // namespace kcenon::vsm
