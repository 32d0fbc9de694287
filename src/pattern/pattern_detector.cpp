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
#include <sstream>

namespace kcenon::vsm {

// ========== Classification helpers ==========

pattern_type classify_feature_kind(feature_kind kind) noexcept {
    switch (kind) {
        case feature_kind::frequency: return pattern_type::temporal;
        case feature_kind::spatial_distribution: return pattern_type::spatial;
        case feature_kind::behavioral_signature: return pattern_type::behavioral;
        default: return pattern_type::structural;
    }
}

meta_pattern_type derive_meta_type(pattern_type a, pattern_type b) noexcept {
    if (a == b) {
        switch (a) {
            case pattern_type::temporal: return meta_pattern_type::temporal_hierarchy;
            case pattern_type::spatial: return meta_pattern_type::spatial_hierarchy;
            case pattern_type::behavioral: return meta_pattern_type::behavioral_composition;
            default: break;
        }
    }
    return meta_pattern_type::cross_domain;
}

// ========== pattern_detector Implementation ==========

pattern_detector::pattern_detector(const pattern_detector_config& config,
                                   std::shared_ptr<policy_authority> policy,
                                   std::shared_ptr<similarity_metric> metric,
                                   logger_ptr logger)
    : service_unit("pattern_detector", std::move(logger))
    , config_(config)
    , extractor_(config.segment_size, config.segment_step)
    , policy_(std::move(policy))
    , metric_(metric ? std::move(metric) : std::make_shared<feature_distance_similarity>()) {}

pattern_detector::~pattern_detector() {
    stop();
}

detection_result pattern_detector::detect_patterns(const std::vector<double>& stream) {
    return detect_patterns(observation_batch{stream, {}, {}});
}

detection_result pattern_detector::detect_patterns(const observation_batch& batch) {
    return request([this, &batch]() { return run_detection(batch); });
}

detection_result pattern_detector::detect_patterns(const signal_snapshot& snapshot) {
    return detect_patterns(observation_batch{snapshot_to_stream(snapshot), {}, {}});
}

void pattern_detector::submit_observations(observation_batch batch) {
    auto shared = std::make_shared<observation_batch>(std::move(batch));
    notify([this, shared]() { buffer_.push_back(std::move(*shared)); });
}

pattern_state pattern_detector::get_pattern_state() const {
    return request([this]() {
        pattern_state state;
        state.total_patterns = patterns_.size();
        state.meta_patterns = meta_patterns_.size();
        state.evolving_patterns = static_cast<size_t>(std::count_if(
            lineages_.begin(), lineages_.end(),
            [](const auto& entry) { return entry.second.size() > 1; }));
        state.emergence_events = emergence_events_.size();
        state.graph_nodes = graph_.nodes.size();
        state.graph_edges = graph_.edges.size();
        state.buffered_batches = buffer_.size();
        state.metrics = metrics_;
        return state;
    });
}

std::vector<pattern> pattern_detector::get_patterns() const {
    return request([this]() {
        return std::vector<pattern>(patterns_.begin(), patterns_.end());
    });
}

result<pattern> pattern_detector::get_pattern(const std::string& pattern_id) const {
    return request([this, &pattern_id]() -> result<pattern> {
        const pattern* found = find_pattern(pattern_id);
        if (!found) {
            return make_error<pattern>(vsm_error_code::not_found,
                                       "Unknown pattern: " + pattern_id);
        }
        return make_success(pattern(*found));
    });
}

std::vector<meta_pattern> pattern_detector::get_meta_patterns() const {
    return request([this]() { return meta_patterns_; });
}

pattern_graph pattern_detector::get_pattern_graph() const {
    return request([this]() { return graph_; });
}

std::vector<emergence_event> pattern_detector::get_emergence_events() const {
    return request([this]() {
        return std::vector<emergence_event>(emergence_events_.begin(), emergence_events_.end());
    });
}

void pattern_detector::set_policy_authority(std::shared_ptr<policy_authority> policy) {
    request([this, p = std::move(policy)]() mutable {
        policy_ = std::move(p);
        return true;
    });
}

result_void pattern_detector::validate_start() {
    if (!config_.validate()) {
        return make_void_error(vsm_error_code::invalid_configuration,
                               "Invalid pattern detector configuration");
    }
    return make_void_success();
}

void pattern_detector::on_started() {
    schedule_after(config_.analysis_interval, [this]() { analyze_buffer(); });
}

// ========== Detection pipeline ==========

std::vector<pattern> pattern_detector::build_patterns(const observation_batch& batch) {
    std::map<feature_kind, std::vector<feature>> clusters;
    for (auto& f : extractor_.extract(batch)) {
        clusters[f.kind()].push_back(std::move(f));
    }

    const double scale = std::max(
        1.0, static_cast<double>(batch.values.size()) / static_cast<double>(config_.segment_size));

    std::vector<pattern> built;
    for (auto& [kind, features] : clusters) {
        pattern p;
        p.id = "pattern_" + std::to_string(next_pattern_id_++);
        p.type = classify_feature_kind(kind);
        p.scale = scale;

        double total = 0.0;
        for (const auto& f : features) {
            total += f.strength;
        }
        p.strength = features.empty() ? 0.5 : total / static_cast<double>(features.size());
        p.features = std::move(features);
        built.push_back(std::move(p));
    }
    return built;
}

detection_result pattern_detector::run_detection(const observation_batch& batch) {
    detection_result result;
    if (batch.empty()) {
        result.graph_complexity = graph_.complexity();
        return result;
    }

    auto fresh = build_patterns(batch);

    // Emergence is judged against the history before this cycle.
    double score_total = 0.0;
    for (auto& p : fresh) {
        double max_similarity = 0.0;
        const pattern* closest = nullptr;
        for (const auto& stored : patterns_) {
            const double s = metric_->similarity(p, stored);
            if (closest == nullptr || s > max_similarity) {
                max_similarity = s;
                closest = &stored;
            }
        }

        const double novelty = closest ? 1.0 - max_similarity : 1.0;
        p.emergence_score = std::clamp(p.strength * 0.5 + novelty * 0.5, 0.0, 1.0);
        score_total += p.emergence_score;

        if (closest == nullptr || max_similarity <= config_.similarity_threshold) {
            result.emergent_ids.push_back(p.id);
        } else {
            append_evolution(closest->id, p);
        }
    }

    for (const auto& p : fresh) {
        store_pattern(p);
    }

    result.meta_patterns = form_meta_patterns(fresh);
    result.emergence_score = fresh.empty() ? 0.0 : score_total / static_cast<double>(fresh.size());
    result.graph_complexity = graph_.complexity();

    const double emergent = static_cast<double>(result.emergent_ids.size());
    metrics_.total_detected += result.emergent_ids.size();
    metrics_.emergence_rate = metrics_.emergence_rate * 0.9 + emergent * 0.1;
    metrics_.meta_pattern_count += result.meta_patterns.size();

    if (!result.emergent_ids.empty()) {
        publish(intelligence_event_kind::pattern_emerged,
                std::to_string(result.emergent_ids.size()) + " emergent patterns", emergent);
    }
    if (!result.meta_patterns.empty()) {
        publish(intelligence_event_kind::meta_pattern_formed,
                std::to_string(result.meta_patterns.size()) + " meta-patterns formed",
                static_cast<double>(result.meta_patterns.size()));
    }

    std::ostringstream oss;
    oss << "detected " << fresh.size() << " patterns (" << result.emergent_ids.size()
        << " emergent, " << result.meta_patterns.size() << " meta), graph complexity "
        << result.graph_complexity;
    log(log_level::trace, oss.str());

    escalate_emergence(result, result.meta_patterns.size());

    result.patterns = std::move(fresh);
    return result;
}

void pattern_detector::store_pattern(const pattern& p) {
    patterns_.push_back(p);
    graph_.nodes.push_back(p.id);

    evolution_sample origin;
    origin.timestamp = p.timestamp;
    origin.strength = p.strength;
    origin.type = p.type;
    origin.emergence_score = p.emergence_score;
    lineages_[p.id].push_back(origin);

    while (patterns_.size() > config_.history_limit) {
        const std::string evicted = patterns_.front().id;
        patterns_.pop_front();
        evict_pattern(evicted);
    }
}

void pattern_detector::evict_pattern(const std::string& pattern_id) {
    lineages_.erase(pattern_id);
    for (auto it = linked_pairs_.begin(); it != linked_pairs_.end();) {
        if (it->first == pattern_id || it->second == pattern_id) {
            it = linked_pairs_.erase(it);
        } else {
            ++it;
        }
    }

    // Meta-patterns and graph entries only reference retained patterns.
    std::erase_if(meta_patterns_, [&pattern_id](const meta_pattern& meta) {
        return std::find(meta.component_pattern_ids.begin(), meta.component_pattern_ids.end(),
                         pattern_id) != meta.component_pattern_ids.end();
    });
    std::erase(graph_.nodes, pattern_id);
    std::erase_if(graph_.edges, [&pattern_id](const pattern_edge& edge) {
        return edge.from == pattern_id || edge.to == pattern_id;
    });
}

void pattern_detector::append_evolution(const std::string& pattern_id,
                                        const pattern& sample_source) {
    auto it = lineages_.find(pattern_id);
    if (it == lineages_.end()) {
        return;
    }

    evolution_sample sample;
    sample.timestamp = sample_source.timestamp;
    sample.strength = sample_source.strength;
    sample.type = sample_source.type;
    sample.emergence_score = sample_source.emergence_score;
    it->second.push_back(sample);
    while (it->second.size() > config_.evolution_history_limit) {
        it->second.pop_front();
    }
}

std::vector<meta_pattern> pattern_detector::form_meta_patterns(const std::vector<pattern>& fresh) {
    std::vector<meta_pattern> formed;
    std::set<std::string> fresh_ids;
    for (const auto& p : fresh) {
        fresh_ids.insert(p.id);
    }

    for (const auto& p : fresh) {
        if (find_pattern(p.id) == nullptr) {
            continue;
        }
        for (const auto& other : patterns_) {
            if (other.id == p.id) {
                continue;
            }
            // Pairs of two fresh patterns are visited from both sides.
            if (fresh_ids.count(other.id) > 0 && other.id < p.id) {
                continue;
            }

            const double correlation = metric_->similarity(p, other);
            if (correlation > config_.edge_threshold) {
                graph_.edges.push_back(pattern_edge{other.id, p.id, correlation});
            }
            if (correlation <= config_.meta_threshold) {
                continue;
            }

            auto key = std::minmax(p.id, other.id);
            if (!linked_pairs_.emplace(key.first, key.second).second) {
                continue;
            }

            meta_pattern meta;
            meta.id = "meta_" + std::to_string(next_meta_id_++);
            meta.component_pattern_ids = {key.first, key.second};
            meta.meta_type = derive_meta_type(p.type, other.type);
            meta.strength = (p.strength + other.strength) / 2.0 * 0.9;
            formed.push_back(meta);
        }
    }

    for (const auto& meta : formed) {
        meta_patterns_.push_back(meta);
    }
    if (meta_patterns_.size() > config_.history_limit) {
        meta_patterns_.erase(meta_patterns_.begin(),
                             meta_patterns_.begin() +
                                 static_cast<std::ptrdiff_t>(meta_patterns_.size() - config_.history_limit));
    }
    return formed;
}

void pattern_detector::escalate_emergence(const detection_result& result, size_t new_meta_count) {
    if (result.emergent_ids.size() <= config_.emergent_escalation_count &&
        new_meta_count <= config_.meta_escalation_count) {
        return;
    }
    if (!policy_) {
        log(log_level::warning, "emergence exceeds local handling but no policy authority is set");
        return;
    }

    pattern_emergence_notice notice;
    notice.emergent_ids = result.emergent_ids;
    notice.meta_pattern_count = new_meta_count;
    notice.emergence_score = result.emergence_score;

    auto submitted = policy_->handle_pattern_emergence(notice);
    if (submitted.is_err()) {
        log(log_level::error, "pattern emergence escalation failed: " + submitted.error().message);
    } else {
        log(log_level::info, "escalated " + std::to_string(notice.emergent_ids.size()) +
                             " emergent patterns to " + policy_->name());
    }
}

const pattern* pattern_detector::find_pattern(const std::string& pattern_id) const {
    auto it = std::find_if(patterns_.begin(), patterns_.end(),
                           [&pattern_id](const pattern& p) { return p.id == pattern_id; });
    return it == patterns_.end() ? nullptr : &*it;
}

double pattern_detector::lineage_stability(const std::string& pattern_id) const {
    auto it = lineages_.find(pattern_id);
    if (it == lineages_.end() || it->second.size() < 2) {
        return 1.0;
    }
    std::vector<double> strengths;
    for (const auto& s : it->second) {
        strengths.push_back(s.strength);
    }
    return std::exp(-stats::variance(stats::tail(strengths, 10)));
}

void pattern_detector::analyze_buffer() {
    size_t drained = 0;
    while (!buffer_.empty()) {
        auto batch = std::move(buffer_.front());
        buffer_.pop_front();
        run_detection(batch);
        ++drained;
    }
    if (drained > 0) {
        log(log_level::debug, "analysis tick drained " + std::to_string(drained) + " batches");
    }

    if (is_running()) {
        schedule_after(config_.analysis_interval, [this]() { analyze_buffer(); });
    }
}

} // namespace kcenon::vsm
