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

#include "kcenon/vsm/pattern/pattern_detector.h"
#include "kcenon/vsm/utils/statistics.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace kcenon::vsm {

namespace {

double structural_regularity(const pattern& p) {
    std::vector<double> regularities;
    for (const auto& f : p.features) {
        if (const auto* s = std::get_if<structural_features>(&f.values)) {
            regularities.push_back(s->regularity);
        }
    }
    return regularities.empty() ? 0.5 : stats::mean(regularities);
}

scale_band classify_scale(const pattern& p) {
    if (p.strength > 0.7) {
        return scale_band::macro;
    }
    if (p.strength > 0.3) {
        return scale_band::meso;
    }
    return scale_band::micro;
}

hierarchy_level classify_hierarchy(double strength) {
    if (strength > 0.8) {
        return hierarchy_level::dominant;
    }
    if (strength > 0.5) {
        return hierarchy_level::intermediate;
    }
    if (strength > 0.2) {
        return hierarchy_level::subordinate;
    }
    return hierarchy_level::weak;
}

// Overlap of type frequencies between two pattern sets.
double set_similarity(const std::vector<const pattern*>& first,
                      const std::vector<const pattern*>& second) {
    if (first.empty() || second.empty()) {
        return 0.0;
    }
    std::map<pattern_type, size_t> c1;
    std::map<pattern_type, size_t> c2;
    std::set<pattern_type> types;
    for (const auto* p : first) {
        c1[p->type]++;
        types.insert(p->type);
    }
    for (const auto* p : second) {
        c2[p->type]++;
        types.insert(p->type);
    }

    double total = 0.0;
    for (auto type : types) {
        const double a = static_cast<double>(c1[type]);
        const double b = static_cast<double>(c2[type]);
        total += 2.0 * std::min(a, b) / (a + b);
    }
    return total / static_cast<double>(types.size());
}

} // namespace

emergence_level bucket_emergence(double mean_emergence) noexcept {
    if (mean_emergence > 0.8) {
        return emergence_level::high;
    }
    if (mean_emergence > 0.5) {
        return emergence_level::medium;
    }
    if (mean_emergence > 0.2) {
        return emergence_level::low;
    }
    return emergence_level::minimal;
}

interaction_kind classify_interaction(const pattern& a, const pattern& b) noexcept {
    if (a.type == b.type && a.strength > 0.5 && b.strength > 0.5) {
        return interaction_kind::reinforcing;
    }
    if (a.type != b.type && (a.strength > 0.7 || b.strength > 0.7)) {
        return interaction_kind::inhibiting;
    }
    if (std::abs(a.strength - b.strength) > 0.3) {
        return interaction_kind::modulating;
    }
    return interaction_kind::neutral;
}

// ========== Emergence ==========

emergence_analysis pattern_detector::analyze_emergence(const std::vector<pattern>& pattern_set) {
    return request([this, &pattern_set]() {
        emergence_analysis analysis;
        if (pattern_set.empty()) {
            return analysis;
        }

        std::vector<double> scores;
        std::vector<double> strengths;
        std::set<pattern_type> types;
        for (const auto& p : pattern_set) {
            scores.push_back(p.emergence_score);
            strengths.push_back(p.strength);
            types.insert(p.type);
        }
        analysis.mean_emergence = stats::mean(scores);
        analysis.level = bucket_emergence(analysis.mean_emergence);

        for (size_t i = 0; i < pattern_set.size(); ++i) {
            for (size_t j = i + 1; j < pattern_set.size(); ++j) {
                const auto& a = pattern_set[i];
                const auto& b = pattern_set[j];
                pattern_interaction interaction;
                interaction.first_id = a.id;
                interaction.second_id = b.id;
                interaction.kind = classify_interaction(a, b);
                interaction.strength = (a.strength + b.strength) / 2.0 * metric_->similarity(a, b);
                if (interaction.strength > 0.7) {
                    analysis.strong_interactions++;
                }
                analysis.interactions.push_back(std::move(interaction));
            }
        }

        for (const auto& p : pattern_set) {
            if (p.strength <= 0.8 && p.emergence_score <= 0.7) {
                continue;
            }
            critical_point point;
            point.pattern_id = p.id;
            point.criticality = (p.strength + p.emergence_score) / 2.0;
            if (p.emergence_score > 0.9) {
                point.type = critical_point_type::emergence_critical;
            } else if (p.strength > 0.9) {
                point.type = critical_point_type::strength_critical;
            }
            analysis.critical_points.push_back(std::move(point));
        }

        const double mean_size = analyzed_set_sizes_.empty()
            ? 0.0
            : stats::mean(std::vector<size_t>(analyzed_set_sizes_.begin(), analyzed_set_sizes_.end()));
        if (!analyzed_set_sizes_.empty() &&
            static_cast<double>(pattern_set.size()) > mean_size * 1.5) {
            analysis.phase_transitions.push_back(phase_transition{"growth", "consolidation", 0.2});
        }
        analyzed_set_sizes_.push_back(pattern_set.size());
        while (analyzed_set_sizes_.size() > config_.event_history_limit) {
            analyzed_set_sizes_.pop_front();
        }

        const double order = 1.0 - std::min(stats::variance(strengths), 1.0);
        const double hierarchy = types.size() >= 4 ? 0.8 : 0.3;
        analysis.self_organization = (order + hierarchy) / 2.0;

        analysis.complexity_measure =
            static_cast<double>(types.size()) / static_cast<double>(pattern_set.size());

        std::vector<double> regularities;
        for (const auto& p : pattern_set) {
            regularities.push_back(structural_regularity(p));
        }
        analysis.predictability = stats::mean(regularities);

        if (analysis.mean_emergence > config_.emergence_threshold) {
            emergence_event event;
            event.level = analysis.level;
            event.mean_emergence = analysis.mean_emergence;
            event.pattern_count = pattern_set.size();
            emergence_events_.push_back(event);
            while (emergence_events_.size() > config_.event_history_limit) {
                emergence_events_.pop_front();
            }
            log(log_level::info, std::string("emergence event recorded at level ") +
                                 to_string(analysis.level));
            publish(intelligence_event_kind::emergence_recorded,
                    "emergence event recorded", analysis.mean_emergence);
        }
        return analysis;
    });
}

// ========== Evolution ==========

result<evolution_record> pattern_detector::track_evolution(const std::string& pattern_id) {
    return request([this, &pattern_id]() -> result<evolution_record> {
        auto it = lineages_.find(pattern_id);
        if (it == lineages_.end()) {
            return make_error<evolution_record>(vsm_error_code::not_found,
                                                "Unknown pattern: " + pattern_id);
        }

        evolution_record record;
        record.pattern_id = pattern_id;
        record.history.assign(it->second.begin(), it->second.end());

        std::vector<double> strengths;
        for (const auto& sample : record.history) {
            strengths.push_back(sample.strength);
        }

        if (strengths.size() >= 2) {
            const auto recent = stats::tail(strengths, 5);
            const double slope = stats::linear_slope(recent);
            for (int step = 1; step <= 5; ++step) {
                record.trajectory.push_back(std::clamp(recent.back() + slope * step, 0.0, 1.0));
            }
        }

        for (size_t i = 1; i < record.history.size(); ++i) {
            const auto& before = record.history[i - 1];
            const auto& after = record.history[i];
            const double delta = after.strength - before.strength;
            if (before.type != after.type) {
                record.mutations.push_back(pattern_mutation{
                    i, mutation_kind::type_change, before.type, after.type, delta});
            } else if (std::abs(delta) > 0.3) {
                record.mutations.push_back(pattern_mutation{
                    i, mutation_kind::strength_shift, before.type, after.type, delta});
            }
        }

        record.stability = lineage_stability(pattern_id);
        return make_success(std::move(record));
    });
}

result<trajectory_prediction> pattern_detector::predict_pattern_trajectory(
    const pattern& target, std::chrono::milliseconds horizon) {
    if (horizon.count() <= 0) {
        return make_error<trajectory_prediction>(vsm_error_code::invalid_argument,
                                                 "Prediction horizon must be positive");
    }

    return request([this, &target, horizon]() -> result<trajectory_prediction> {
        trajectory_prediction prediction;
        prediction.pattern_id = target.id;

        std::vector<double> history;
        auto it = lineages_.find(target.id);
        if (it != lineages_.end()) {
            for (const auto& sample : it->second) {
                history.push_back(sample.strength);
            }
        }

        const double trend = history.size() >= 2 ? stats::linear_slope(stats::tail(history, 10)) : 0.0;
        const int steps = static_cast<int>(horizon.count() / 100);
        for (int step = 1; step <= steps; ++step) {
            predicted_state state;
            state.step = step;
            state.offset_ms = static_cast<int64_t>(step) * 100;
            state.strength = std::clamp(target.strength + trend * step, 0.0, 1.0);
            state.confidence = std::exp(-0.1 * step);
            prediction.predicted_states.push_back(state);
        }

        const double stability = history.size() >= 2 ? lineage_stability(target.id) : 0.5;
        const double coverage = std::min(static_cast<double>(history.size()) / 100.0, 1.0);
        prediction.confidence = (stability + coverage) / 2.0;

        if (std::abs(target.strength - 0.5) <= 0.1) {
            prediction.bifurcation_points.push_back(bifurcation_point{
                static_cast<int64_t>(horizon.count() / 2), bifurcation_kind::critical_threshold, target.strength});
        }
        if (target.strength > 0.9 || target.strength < 0.1) {
            prediction.bifurcation_points.push_back(bifurcation_point{
                static_cast<int64_t>(horizon.count() / 4), bifurcation_kind::extreme_value, target.strength});
        }

        if (history.size() >= 10) {
            std::map<long, size_t> basins;
            for (double v : history) {
                basins[std::lround(v / 0.1)]++;
            }
            for (const auto& [bucket, count] : basins) {
                attractor_state attractor;
                attractor.value = static_cast<double>(bucket) * 0.1;
                attractor.basin_size = count;
                if (attractor.value > 0.8) {
                    attractor.kind = attractor_kind::strong;
                } else if (attractor.value < 0.2) {
                    attractor.kind = attractor_kind::weak;
                }
                prediction.attractor_states.push_back(attractor);
            }
        }

        metrics_.prediction_accuracy = metrics_.prediction_accuracy * 0.9 + prediction.confidence * 0.1;
        return make_success(std::move(prediction));
    });
}

// ========== Meta-pattern analysis ==========

meta_pattern_analysis pattern_detector::identify_meta_patterns() {
    return request([this]() {
        meta_pattern_analysis analysis;
        const std::vector<pattern> all(patterns_.begin(), patterns_.end());

        // Recursive structures: same type, similar, at different scales.
        for (size_t i = 0; i < all.size(); ++i) {
            for (size_t j = i + 1; j < all.size(); ++j) {
                const auto& a = all[i];
                const auto& b = all[j];
                if (a.type != b.type) {
                    continue;
                }
                const double depth = std::abs(a.scale - b.scale);
                if (depth <= 0.3) {
                    continue;
                }
                const double s = metric_->similarity(a, b);
                if (s > 0.7) {
                    analysis.recursive_structures.push_back(
                        recursive_structure{a.id, b.id, a.type, s, depth});
                }
            }
        }

        // Pattern of patterns
        auto& pop = analysis.patterns_of_patterns;
        for (const auto& p : all) {
            pop.distribution[p.type]++;
        }
        size_t dominant_count = 0;
        for (const auto& [type, count] : pop.distribution) {
            if (count > dominant_count) {
                dominant_count = count;
                pop.dominant_type = type;
            }
        }
        if (all.size() >= 2) {
            std::vector<std::chrono::system_clock::time_point> stamps;
            for (const auto& p : all) {
                stamps.push_back(p.timestamp);
            }
            std::sort(stamps.begin(), stamps.end());
            std::vector<double> intervals;
            for (size_t i = 1; i < stamps.size(); ++i) {
                intervals.push_back(static_cast<double>(
                    std::chrono::duration_cast<std::chrono::milliseconds>(stamps[i] - stamps[i - 1]).count()));
            }
            pop.meta_regularity = std::exp(-stats::variance(intervals) / 1000000.0);
        }
        std::set<std::string> ids;
        for (const auto& p : all) {
            ids.insert(p.id);
        }
        pop.meta_complexity = std::min(
            1.0, (static_cast<double>(pop.distribution.size()) / 10.0 +
                  static_cast<double>(ids.size()) / 100.0) / 2.0);

        // Emergent hierarchy by strength bucket
        auto& hierarchy = analysis.hierarchy;
        for (const auto& p : all) {
            hierarchy.levels[classify_hierarchy(p.strength)].push_back(p.id);
        }
        hierarchy.depth = hierarchy.levels.size();
        if (hierarchy.levels.empty()) {
            hierarchy.balance = 1.0;
        } else {
            std::vector<size_t> counts;
            for (const auto& [level, members] : hierarchy.levels) {
                counts.push_back(members.size());
            }
            hierarchy.balance = std::exp(-stats::variance(counts) / 10.0);
        }

        // Self-similarity across scale bands
        std::map<scale_band, std::vector<const pattern*>> bands;
        for (const auto& p : all) {
            bands[classify_scale(p)].push_back(&p);
        }
        const scale_band order[] = {scale_band::micro, scale_band::meso, scale_band::macro};
        double similarity_total = 0.0;
        for (size_t i = 0; i < 3; ++i) {
            for (size_t j = i + 1; j < 3; ++j) {
                scale_comparison comparison;
                comparison.first = order[i];
                comparison.second = order[j];
                comparison.similarity = set_similarity(bands[order[i]], bands[order[j]]);
                comparison.self_similar = comparison.similarity > 0.7;
                similarity_total += comparison.similarity;
                analysis.self_similarity.comparisons.push_back(comparison);
            }
        }
        analysis.self_similarity.index =
            similarity_total / static_cast<double>(analysis.self_similarity.comparisons.size());
        std::set<double> scales;
        for (const auto& p : all) {
            scales.insert(p.scale);
        }
        if (scales.size() > 1) {
            analysis.self_similarity.fractal_dimension =
                std::log(static_cast<double>(all.size())) / std::log(static_cast<double>(scales.size()));
        }

        // Universal patterns: strong and stable
        auto& universal = analysis.universal_patterns;
        double strongest = -1.0;
        double stability_total = 0.0;
        for (const auto& p : all) {
            const double stability = lineage_stability(p.id);
            stability_total += stability;
            if (p.strength > 0.6 && stability > 0.7) {
                universal.pattern_ids.push_back(p.id);
                if (p.strength > strongest) {
                    strongest = p.strength;
                    universal.dominant_id = p.id;
                }
            }
        }
        universal.universality_index = static_cast<double>(universal.pattern_ids.size()) /
                                       static_cast<double>(std::max<size_t>(all.size(), 1));
        if (!all.empty()) {
            metrics_.stability_index = stability_total / static_cast<double>(all.size());
        }

        const double ssi = analysis.self_similarity.index;
        const double ui = universal.universality_index;
        analysis.evolution_recommended = !analysis.recursive_structures.empty() ||
                                         hierarchy.depth > 3 || ssi > 0.8 || ui > 0.7;

        if (!analysis.recursive_structures.empty()) {
            analysis.recommended_evolution = evolution_kind::recursive_expansion;
        } else if (hierarchy.depth > 3) {
            analysis.recommended_evolution = evolution_kind::hierarchical_restructuring;
        } else if (ssi > 0.8) {
            analysis.recommended_evolution = evolution_kind::fractal_evolution;
        } else if (ui > 0.7) {
            analysis.recommended_evolution = evolution_kind::universal_integration;
        }

        int signals = 0;
        signals += analysis.recursive_structures.size() > 5 ? 1 : 0;
        signals += hierarchy.depth > 4 ? 1 : 0;
        signals += ssi > 0.9 ? 1 : 0;
        signals += ui > 0.8 ? 1 : 0;
        if (signals >= 3) {
            analysis.urgency = escalation_urgency::critical;
        } else if (signals >= 2) {
            analysis.urgency = escalation_urgency::high;
        } else if (signals >= 1) {
            analysis.urgency = escalation_urgency::medium;
        }

        if (analysis.evolution_recommended && policy_) {
            system_evolution_proposal proposal;
            proposal.recommended_evolution = analysis.recommended_evolution;
            proposal.urgency = analysis.urgency;
            proposal.recursive_structures = analysis.recursive_structures.size();
            proposal.hierarchy_depth = hierarchy.depth;
            proposal.self_similarity_index = ssi;
            proposal.universality_index = ui;

            auto submitted = policy_->propose_system_evolution(proposal);
            if (submitted.is_err()) {
                log(log_level::error, "system evolution proposal failed: " + submitted.error().message);
            } else {
                log(log_level::info, std::string("proposed ") + to_string(proposal.recommended_evolution) +
                                     " to " + policy_->name());
            }
        }
        return analysis;
    });
}

} // namespace kcenon::vsm
