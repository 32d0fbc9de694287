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
 * @file signal_source.h
 * @brief Upstream provider of environmental signals
 */

#include <string>

#include "../core/result_types.h"
#include "../scanner/signal_types.h"

namespace kcenon::vsm {

/**
 * @class signal_source
 * @brief Supplies the raw signal families for a scan
 *
 * The scanner trims the returned families to the requested scope, so a
 * source always reports everything it knows.
 */
class signal_source {
public:
    virtual ~signal_source() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Whether the source can currently be queried
     */
    virtual bool is_available() const = 0;

    /**
     * @brief Fetch all signal families
     * @return Snapshot, or an error when the upstream fetch fails
     */
    virtual result<signal_snapshot> fetch() = 0;
};

/**
 * @class baseline_signal_source
 * @brief Source returning a fixed baseline of environmental signals
 */
class baseline_signal_source : public signal_source {
public:
    std::string name() const override { return "baseline_signal_source"; }

    bool is_available() const override { return true; }

    result<signal_snapshot> fetch() override;
};

} // namespace kcenon::vsm
