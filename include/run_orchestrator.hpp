/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <stop_token>
#include <vector>

#include "include/endpoint_config.hpp"
#include "include/endpoint_tester.hpp"
#include "include/results.hpp"

namespace authprobe {

struct RunObserver {
    // index is zero-based; total is the number of endpoints in the run.
    std::function<void(std::size_t index, std::size_t total, const EndpointDefinition&)> on_start;
    std::function<void(const TestOutcome&)> on_finish;
};

// One pass over the outcomes. A failed endpoint lands in exactly one bucket,
// picked by the earliest stage that failed.
[[nodiscard]] RunSummary summarize(const std::vector<TestOutcome>& outcomes);

class RunOrchestrator {
    const EndpointTester& tester_;
    RunObserver observer_;

   public:
    explicit RunOrchestrator(const EndpointTester& tester, RunObserver observer = {});

    // Tests every endpoint in declaration order, one at a time. A failing
    // endpoint never stops the run; InterruptedError does.
    [[nodiscard]] RunReport run(const std::vector<EndpointDefinition>& endpoints,
                                std::stop_token stop = {}) const;
};

}  // namespace authprobe
