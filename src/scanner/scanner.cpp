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

#include "kcenon/vsm/scanner/scanner.h"

#include <sstream>

namespace kcenon::vsm {

// ========== baseline_signal_source Implementation ==========

result<signal_snapshot> baseline_signal_source::fetch() {
    signal_snapshot snapshot;
    snapshot.market_signals = {
        {"increased_demand", 0.7, "sales_data"},
        {"price_pressure", 0.4, "market_analysis"},
        {"new_segment_emerging", 0.6, "tidewave"}
    };
    snapshot.technology_trends = {
        {"ai_adoption", impact_level::high, "6_months"},
        {"edge_computing", impact_level::medium, "12_months"}
    };
    snapshot.regulatory_updates = {
        {"data_privacy", "proposed", impact_level::medium}
    };
    snapshot.competitive_moves = {
        {"comp_a", "new_product", impact_level::medium}
    };
    return make_success(std::move(snapshot));
}

// ========== Snapshot validation ==========

result_void validate_snapshot(const signal_snapshot& snapshot) {
    if (snapshot.coverage < 0.0 || snapshot.coverage > 1.0) {
        return make_void_error(vsm_error_code::malformed_snapshot,
                               "Coverage outside [0, 1]");
    }

    for (const auto& s : snapshot.market_signals) {
        if (s.signal.empty()) {
            return make_void_error(vsm_error_code::malformed_snapshot,
                                   "Market signal without identifier");
        }
        if (s.strength < 0.0 || s.strength > 1.0) {
            return make_void_error(vsm_error_code::malformed_snapshot,
                                   "Market signal '" + s.signal + "' strength outside [0, 1]");
        }
    }
    for (const auto& t : snapshot.technology_trends) {
        if (t.trend.empty()) {
            return make_void_error(vsm_error_code::malformed_snapshot,
                                   "Technology trend without identifier");
        }
    }
    for (const auto& r : snapshot.regulatory_updates) {
        if (r.regulation.empty()) {
            return make_void_error(vsm_error_code::malformed_snapshot,
                                   "Regulatory update without identifier");
        }
    }
    for (const auto& c : snapshot.competitive_moves) {
        if (c.competitor.empty()) {
            return make_void_error(vsm_error_code::malformed_snapshot,
                                   "Competitive move without competitor");
        }
    }
    return make_void_success();
}

// ========== scanner Implementation ==========

scanner::scanner(const scanner_config& config,
                 std::shared_ptr<signal_source> source,
                 logger_ptr logger)
    : service_unit("scanner", std::move(logger))
    , config_(config)
    , source_(std::move(source)) {}

scanner::~scanner() {
    stop();
}

signal_snapshot scanner::scan(scan_scope scope) {
    return request([this, scope]() { return perform_scan(scope); });
}

void scanner::set_snapshot_handler(snapshot_handler handler) {
    request([this, h = std::move(handler)]() mutable {
        handler_ = std::move(h);
        return true;
    });
}

void scanner::set_signal_source(std::shared_ptr<signal_source> source) {
    request([this, s = std::move(source)]() mutable {
        source_ = std::move(s);
        return true;
    });
}

std::vector<signal_snapshot> scanner::get_scan_history() const {
    return request([this]() {
        return std::vector<signal_snapshot>(history_.begin(), history_.end());
    });
}

uint64_t scanner::get_scan_count() const {
    return request([this]() { return scan_count_; });
}

result_void scanner::validate_start() {
    if (!config_.validate()) {
        return make_void_error(vsm_error_code::invalid_configuration,
                               "Invalid scanner configuration");
    }
    return make_void_success();
}

void scanner::on_started() {
    if (config_.periodic_scanning) {
        schedule_after(config_.scan_interval, [this]() { periodic_scan(); });
    }
}

signal_snapshot scanner::perform_scan(scan_scope scope) {
    signal_snapshot snapshot;
    snapshot.scope = scope;
    snapshot.coverage = scope_coverage(scope);
    ++scan_count_;

    if (!source_ || !source_->is_available()) {
        snapshot.source_available = false;
        log(log_level::warning, std::string("signal source unavailable for ") +
                                to_string(scope) + " scan");
        publish(intelligence_event_kind::source_unavailable, "signal source unavailable");
    } else {
        auto fetched = source_->fetch();
        auto valid = fetched.is_ok() ? validate_snapshot(fetched.value()) : make_void_success();
        if (fetched.is_err() || valid.is_err()) {
            const auto& reason = fetched.is_err() ? fetched.error().message : valid.error().message;
            snapshot.source_available = false;
            log(log_level::warning, "signal source '" + source_->name() + "' failed: " + reason);
            publish(intelligence_event_kind::source_unavailable, reason);
        } else {
            const auto& raw = fetched.value();
            snapshot.market_signals = raw.market_signals;
            snapshot.competitive_moves = raw.competitive_moves;
            snapshot.llm_variety = raw.llm_variety;
            if (scope == scan_scope::targeted) {
                snapshot.market_signals.clear();
            }
            if (scope == scan_scope::full) {
                snapshot.technology_trends = raw.technology_trends;
                snapshot.regulatory_updates = raw.regulatory_updates;
            }
        }
    }

    history_.push_front(snapshot);
    while (history_.size() > config_.history_limit) {
        history_.pop_back();
    }

    std::ostringstream oss;
    oss << to_string(scope) << " scan collected " << snapshot.signal_count() << " signals";
    log(log_level::trace, oss.str());
    publish(intelligence_event_kind::scan_completed, oss.str(),
            static_cast<double>(snapshot.signal_count()));
    return snapshot;
}

void scanner::periodic_scan() {
    auto snapshot = perform_scan(scan_scope::full);
    if (handler_) {
        handler_(snapshot);
    }
    if (is_running()) {
        schedule_after(config_.scan_interval, [this]() { periodic_scan(); });
    }
}

} // namespace kcenon::vsm
