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
 * @file scanner.h
 * @brief Environmental scanner
 *
 * Produces structured signal snapshots on demand or on a timer. The scanner
 * holds no decision logic; periodic snapshots are handed to a registered
 * handler (normally the pattern detector).
 */

#include <deque>
#include <functional>
#include <memory>
#include <vector>

#include "signal_types.h"
#include "../config/intelligence_config.h"
#include "../core/service_unit.h"
#include "../interfaces/signal_source.h"

namespace kcenon::vsm {

/**
 * @brief Check a snapshot for malformed content
 * @return malformed_snapshot when coverage or a market strength is outside
 *         [0, 1], or when any signal has an empty identifier
 */
result_void validate_snapshot(const signal_snapshot& snapshot);

/**
 * @class scanner
 * @brief Collects signal snapshots from a signal source
 *
 * @thread_safety All public methods are thread-safe.
 *
 * @example
 * @code
 * scanner env_scanner(scanner_config{}, std::make_shared<baseline_signal_source>());
 * env_scanner.start();
 * auto snapshot = env_scanner.scan(scan_scope::partial);
 * // snapshot.coverage == 0.6
 * @endcode
 */
class scanner : public service_unit {
public:
    using snapshot_handler = std::function<void(const signal_snapshot&)>;

    explicit scanner(const scanner_config& config = scanner_config{},
                     std::shared_ptr<signal_source> source = std::make_shared<baseline_signal_source>(),
                     logger_ptr logger = nullptr);

    ~scanner() override;

    /**
     * @brief Scan the environment at the requested breadth
     *
     * Never fails: an unavailable or failing source yields an empty
     * snapshot with source_available set to false.
     */
    signal_snapshot scan(scan_scope scope);

    /**
     * @brief Register the receiver of periodic snapshots
     */
    void set_snapshot_handler(snapshot_handler handler);

    /**
     * @brief Replace the signal source
     */
    void set_signal_source(std::shared_ptr<signal_source> source);

    std::vector<signal_snapshot> get_scan_history() const;

    uint64_t get_scan_count() const;

protected:
    result_void validate_start() override;
    void on_started() override;

private:
    signal_snapshot perform_scan(scan_scope scope);
    void periodic_scan();

    scanner_config config_;
    std::shared_ptr<signal_source> source_;
    snapshot_handler handler_;
    std::deque<signal_snapshot> history_;
    uint64_t scan_count_{0};
};

} // namespace kcenon::vsm
