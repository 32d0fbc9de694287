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
 * @file intelligence_example.cpp
 * @brief Runs intelligence cycles against a calm and an explosive environment
 *
 * Demonstrates wiring a common_system ILogger into the coordinator and
 * reading the Result<T> values returned by the pattern queries.
 */

#include <kcenon/vsm/intelligence_coordinator.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

using namespace kcenon::vsm;
using namespace kcenon::common::interfaces;
namespace common = kcenon::common;

/**
 * @brief Console logger with timestamps
 */
class simple_console_logger : public ILogger {
private:
    log_level min_level_ = log_level::info;
    std::atomic<size_t> log_count_{0};

public:
    explicit simple_console_logger(log_level min = log_level::info)
        : min_level_(min) {}

    common::VoidResult log(log_level level, const std::string& message) override {
        if (!is_enabled(level)) {
            return common::ok();
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);

        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::cout << "[" << std::put_time(&tm_buf, "%H:%M:%S")
                  << "] [" << to_string(level) << "] "
                  << message << std::endl;

        log_count_++;
        return common::ok();
    }

    common::VoidResult log(log_level level, const std::string& message,
                           const std::string& file, int line, const std::string& function) override {
        return log(level, message + " [" + file + ":" + std::to_string(line) + " " + function + "]");
    }

    common::VoidResult log(const log_entry& entry) override {
        return log(entry.level, entry.message, entry.file, entry.line, entry.function);
    }

    bool is_enabled(log_level level) const override {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    common::VoidResult set_level(log_level level) override {
        min_level_ = level;
        return common::ok();
    }

    log_level get_level() const override {
        return min_level_;
    }

    common::VoidResult flush() override {
        std::cout << std::flush;
        return common::ok();
    }

    size_t get_log_count() const { return log_count_.load(); }
};

/**
 * @brief Source that reports a flood of novel and emergent variety
 */
class turbulent_signal_source : public signal_source {
public:
    std::string name() const override { return "turbulent_signal_source"; }

    bool is_available() const override { return true; }

    result<signal_snapshot> fetch() override {
        signal_snapshot snapshot;
        snapshot.market_signals = {{"new_segment", 0.8, "sales"}, {"price_war", 0.6, "analysis"}};
        snapshot.technology_trends = {{"llm_agents", impact_level::high, "3_months"}};
        snapshot.competitive_moves = {{"rival", "platform_launch", impact_level::high}};

        variety_data variety;
        for (int i = 0; i < 5; ++i) {
            variety.novel_patterns.push_back("novel_" + std::to_string(i));
            variety.emergent_properties.push_back("emergent_" + std::to_string(i));
        }
        snapshot.llm_variety = variety;
        return make_success(snapshot);
    }
};

static void print_cycle(const intelligence_cycle_report& cycle) {
    std::cout << "  signals:   " << cycle.snapshot.signal_count() << std::endl;
    std::cout << "  patterns:  " << cycle.detection.patterns.size()
              << " (" << cycle.detection.emergent_ids.size() << " emergent)" << std::endl;
    for (const auto& p : cycle.detection.patterns) {
        std::cout << "    " << p.id << " " << to_string(p.type)
                  << " strength=" << std::fixed << std::setprecision(2) << p.strength << std::endl;
    }
    std::cout << "  ratio:     " << cycle.risk.variety_ratio << std::endl;
    std::cout << "  risk:      " << cycle.risk.explosion_risk << std::endl;
    std::cout << "  action:    " << to_string(cycle.risk.action) << std::endl;
    if (cycle.proposal) {
        std::cout << "  proposal:  " << cycle.proposal->id << " ("
                  << to_string(cycle.proposal->model_type) << ", submitted="
                  << std::boolalpha << cycle.proposal_submitted << ")" << std::endl;
    }
}

/**
 * @brief Example 1: A calm cycle over the baseline source
 */
void example_1_baseline_cycle(const std::shared_ptr<simple_console_logger>& logger) {
    std::cout << "\n=== Example 1: Baseline Cycle ===" << std::endl;

    intelligence_config config;
    config.scanner.periodic_scanning = false;
    intelligence_coordinator intelligence(config, nullptr, nullptr,
                                          std::make_shared<baseline_signal_source>(),
                                          std::make_shared<elapsed_time_probe>(), logger);

    auto cycle = intelligence.run_intelligence_cycle(scan_scope::full);
    print_cycle(cycle);

    // Detect again so the patterns acquire a lineage
    intelligence.run_intelligence_cycle(scan_scope::full);
    if (!cycle.detection.patterns.empty()) {
        auto evolution = intelligence.track_evolution(cycle.detection.patterns.front().id);
        if (evolution.is_ok()) {
            std::cout << "  lineage of " << cycle.detection.patterns.front().id << ": "
                      << evolution.value().history.size() << " entries" << std::endl;
        } else {
            std::cout << "  evolution unavailable: " << evolution.error().message << std::endl;
        }
    }
}

/**
 * @brief Example 2: Variety explosion with emergency protocols and a proposal
 */
void example_2_variety_explosion(const std::shared_ptr<simple_console_logger>& logger) {
    std::cout << "\n=== Example 2: Variety Explosion ===" << std::endl;

    intelligence_config config;
    config.scanner.periodic_scanning = false;
    intelligence_coordinator intelligence(config, nullptr, nullptr,
                                          std::make_shared<turbulent_signal_source>(),
                                          std::make_shared<elapsed_time_probe>(), logger);

    auto started = intelligence.start();
    if (started.is_err()) {
        std::cout << "✗ start failed: " << started.error().message << std::endl;
        return;
    }

    auto cycle = intelligence.run_intelligence_cycle(scan_scope::full);
    print_cycle(cycle);

    auto cascade = intelligence.predict_cascade(cycle.risk.external_variety * 2.0);
    std::cout << "  cascade stages: " << cascade.cascade_stages.size()
              << ", containment: " << cascade.containment_probability << std::endl;

    if (cycle.proposal) {
        intelligence.implement_adaptation(*cycle.proposal);
        auto metrics = intelligence.get_adaptation_metrics();
        std::cout << "  active adaptations: " << metrics.active_adaptations
                  << ", capacity: " << metrics.adaptation_capacity << std::endl;
    }

    auto stopped = intelligence.stop();
    if (stopped.is_err()) {
        std::cout << "✗ stop failed: " << stopped.error().message << std::endl;
    }
}

/**
 * @brief Example 3: Periodic scanning while started
 */
void example_3_periodic_scanning(const std::shared_ptr<simple_console_logger>& logger) {
    std::cout << "\n=== Example 3: Periodic Scanning ===" << std::endl;

    intelligence_config config;
    config.scanner.scan_interval = std::chrono::milliseconds(50);
    config.pattern.analysis_interval = std::chrono::milliseconds(50);
    intelligence_coordinator intelligence(config, nullptr, nullptr,
                                          std::make_shared<baseline_signal_source>(),
                                          std::make_shared<elapsed_time_probe>(), logger);

    if (intelligence.start().is_err()) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto state = intelligence.get_pattern_state();
    std::cout << "  patterns after 300ms: " << state.total_patterns
              << " (meta: " << state.meta_patterns << ")" << std::endl;

    if (intelligence.stop().is_err()) {
        std::cout << "✗ stop failed" << std::endl;
    }
}

int main() {
    std::cout << "VSM Intelligence Example" << std::endl;
    std::cout << "========================" << std::endl;

    auto logger = std::make_shared<simple_console_logger>(log_level::info);

    example_1_baseline_cycle(logger);
    example_2_variety_explosion(logger);
    example_3_periodic_scanning(logger);

    std::cout << "\nLogged " << logger->get_log_count() << " messages" << std::endl;
    return 0;
}
