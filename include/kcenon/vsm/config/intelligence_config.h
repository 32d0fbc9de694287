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
 * @file intelligence_config.h
 * @brief Configuration of the four intelligence units
 *
 * Defaults reproduce the reference thresholds. Each config can also be read
 * from a flat config_map; unknown keys are ignored and unparseable values
 * fall back to the defaults.
 */

#include <chrono>
#include <cstddef>

#include "../utils/config_parser.h"

namespace kcenon::vsm {

/**
 * @struct scanner_config
 * @brief Configuration for the environmental scanner
 */
struct scanner_config {
    std::chrono::milliseconds scan_interval{60000};   ///< Periodic full scan interval
    size_t history_limit{100};                        ///< Retained snapshots
    bool periodic_scanning{true};                     ///< Arm the periodic scan on start

    bool validate() const {
        return scan_interval.count() > 0 && history_limit > 0;
    }

    static scanner_config from_config(const config_map& config) {
        scanner_config c;
        c.scan_interval = config_parser::get_duration(config, "scanner.scan_interval", c.scan_interval);
        c.history_limit = config_parser::get<size_t>(config, "scanner.history_limit", c.history_limit);
        c.periodic_scanning = config_parser::get<bool>(config, "scanner.periodic", c.periodic_scanning);
        return c;
    }
};

/**
 * @struct pattern_detector_config
 * @brief Configuration for the pattern detector
 */
struct pattern_detector_config {
    std::chrono::milliseconds analysis_interval{1000};   ///< Buffered input analysis interval
    size_t history_limit{1000};                          ///< Retained patterns
    size_t segment_size{100};                            ///< Window length in samples
    size_t segment_step{90};                             ///< Window step in samples
    double emergence_threshold{0.7};                     ///< Mean score that records an emergence event
    double similarity_threshold{0.8};                    ///< Max similarity of an emergent pattern
    double meta_threshold{0.85};                         ///< Correlation that forms a meta-pattern
    double edge_threshold{0.5};                          ///< Correlation that adds a graph edge
    size_t emergent_escalation_count{10};                ///< Emergent patterns per cycle before escalation
    size_t meta_escalation_count{3};                     ///< Meta-patterns per cycle before escalation
    size_t event_history_limit{100};                     ///< Retained emergence events
    size_t evolution_history_limit{100};                 ///< Samples per pattern lineage

    bool validate() const {
        return analysis_interval.count() > 0 && history_limit > 0 &&
               segment_size >= 2 && segment_step > 0 &&
               similarity_threshold >= 0.0 && similarity_threshold <= 1.0 &&
               meta_threshold >= 0.0 && meta_threshold <= 1.0 &&
               edge_threshold >= 0.0 && edge_threshold <= 1.0;
    }

    static pattern_detector_config from_config(const config_map& config) {
        pattern_detector_config c;
        c.analysis_interval = config_parser::get_duration(config, "pattern.analysis_interval", c.analysis_interval);
        c.history_limit = config_parser::get<size_t>(config, "pattern.history_limit", c.history_limit);
        c.segment_size = config_parser::get<size_t>(config, "pattern.segment_size", c.segment_size);
        c.segment_step = config_parser::get<size_t>(config, "pattern.segment_step", c.segment_step);
        c.emergence_threshold = config_parser::get_clamped(config, "pattern.emergence_threshold", c.emergence_threshold, 0.0, 1.0);
        c.similarity_threshold = config_parser::get_clamped(config, "pattern.similarity_threshold", c.similarity_threshold, 0.0, 1.0);
        c.meta_threshold = config_parser::get_clamped(config, "pattern.meta_threshold", c.meta_threshold, 0.0, 1.0);
        c.edge_threshold = config_parser::get_clamped(config, "pattern.edge_threshold", c.edge_threshold, 0.0, 1.0);
        return c;
    }
};

/**
 * @struct variety_monitor_config
 * @brief Configuration for the variety monitor
 */
struct variety_monitor_config {
    std::chrono::milliseconds assessment_interval{5000};   ///< Self-assessment interval
    double initial_capacity{1.0};
    double min_capacity{0.5};
    double max_capacity{10.0};
    double explosion_threshold{0.85};       ///< Risk that triggers remediation
    double cascade_threshold{0.75};         ///< Ratio above which cascades become possible
    double critical_ratio{3.0};             ///< Ratio treated as explosion point
    double initial_absorption_rate{0.7};
    size_t history_limit{1000};             ///< Retained variety samples
    size_t event_history_limit{100};        ///< Retained explosion events
    size_t prediction_history_limit{50};    ///< Retained cascade predictions

    bool validate() const {
        return assessment_interval.count() > 0 &&
               min_capacity > 0.0 && min_capacity <= max_capacity &&
               initial_capacity >= min_capacity && initial_capacity <= max_capacity &&
               critical_ratio > 0.0 && cascade_threshold > 0.0 && cascade_threshold < 1.0 &&
               initial_absorption_rate >= 0.0 && initial_absorption_rate <= 1.0 &&
               history_limit > 0 && event_history_limit > 0 && prediction_history_limit > 0;
    }

    static variety_monitor_config from_config(const config_map& config) {
        variety_monitor_config c;
        c.assessment_interval = config_parser::get_duration(config, "variety.assessment_interval", c.assessment_interval);
        c.initial_capacity = config_parser::get<double>(config, "variety.initial_capacity", c.initial_capacity);
        c.min_capacity = config_parser::get<double>(config, "variety.min_capacity", c.min_capacity);
        c.max_capacity = config_parser::get<double>(config, "variety.max_capacity", c.max_capacity);
        c.explosion_threshold = config_parser::get_clamped(config, "variety.explosion_threshold", c.explosion_threshold, 0.0, 1.0);
        c.cascade_threshold = config_parser::get<double>(config, "variety.cascade_threshold", c.cascade_threshold);
        c.critical_ratio = config_parser::get<double>(config, "variety.critical_ratio", c.critical_ratio);
        c.initial_absorption_rate = config_parser::get_clamped(config, "variety.initial_absorption_rate", c.initial_absorption_rate, 0.0, 1.0);
        c.history_limit = config_parser::get<size_t>(config, "variety.history_limit", c.history_limit);
        return c;
    }
};

/**
 * @struct adaptation_engine_config
 * @brief Configuration for the adaptation engine
 */
struct adaptation_engine_config {
    std::chrono::milliseconds monitor_interval{10000};   ///< Poll interval per active adaptation
    size_t history_limit{100};                           ///< Retained completed adaptations

    bool validate() const {
        return monitor_interval.count() > 0 && history_limit > 0;
    }

    static adaptation_engine_config from_config(const config_map& config) {
        adaptation_engine_config c;
        c.monitor_interval = config_parser::get_duration(config, "adaptation.monitor_interval", c.monitor_interval);
        c.history_limit = config_parser::get<size_t>(config, "adaptation.history_limit", c.history_limit);
        return c;
    }
};

/**
 * @struct intelligence_config
 * @brief Aggregate configuration used by the coordinator
 */
struct intelligence_config {
    scanner_config scanner;
    pattern_detector_config pattern;
    variety_monitor_config variety;
    adaptation_engine_config adaptation;

    bool validate() const {
        return scanner.validate() && pattern.validate() &&
               variety.validate() && adaptation.validate();
    }

    static intelligence_config from_config(const config_map& config) {
        intelligence_config c;
        c.scanner = scanner_config::from_config(config);
        c.pattern = pattern_detector_config::from_config(config);
        c.variety = variety_monitor_config::from_config(config);
        c.adaptation = adaptation_engine_config::from_config(config);
        return c;
    }
};

} // namespace kcenon::vsm
