/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/run_orchestrator.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "include/interrupts.hpp"

namespace authprobe {

RunSummary summarize(const std::vector<TestOutcome>& outcomes) {
    RunSummary summary;
    summary.total = outcomes.size();

    for (const auto& outcome : outcomes) {
        if (outcome.overall_succeeded) {
            ++summary.passed;
            continue;
        }

        ++summary.failed;
        if (!outcome.auth_succeeded) {
            ++summary.auth_failures;
        } else if (!outcome.connect_succeeded) {
            ++summary.connect_failures;
        } else {
            ++summary.response_failures;
        }
    }

    return summary;
}

RunOrchestrator::RunOrchestrator(const EndpointTester& tester, RunObserver observer)
    : tester_(tester), observer_(std::move(observer)) {}

RunReport RunOrchestrator::run(const std::vector<EndpointDefinition>& endpoints,
                               std::stop_token stop) const {
    RunReport report;
    report.outcomes.reserve(endpoints.size());

    for (std::size_t i = 0; i < endpoints.size(); ++i) {
        check_interrupted(stop);

        const auto& endpoint = endpoints[i];
        if (observer_.on_start) observer_.on_start(i, endpoints.size(), endpoint);

        auto outcome = tester_.run(endpoint, stop);
        spdlog::info("{}: {}", endpoint.name, outcome.overall_succeeded ? "passed" : outcome.error_message);

        if (observer_.on_finish) observer_.on_finish(outcome);
        report.outcomes.push_back(std::move(outcome));
    }

    report.summary = summarize(report.outcomes);
    return report;
}

}  // namespace authprobe
