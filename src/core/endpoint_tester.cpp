/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/endpoint_tester.hpp"

#include <format>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "include/interrupts.hpp"
#include "include/utils.hpp"

using namespace std::chrono;

namespace authprobe {

EndpointTester::EndpointTester(TokenAcquirer& tokens,
                               ApiInvoker& api,
                               StageTimeouts timeouts,
                               StageCallback on_stage)
    : tokens_(tokens), api_(api), timeouts_(timeouts), on_stage_(std::move(on_stage)) {}

TestOutcome EndpointTester::run(const EndpointDefinition& endpoint, std::stop_token stop) const {
    static const std::optional<nlohmann::json> no_body;

    TestOutcome outcome;
    outcome.endpoint_name = endpoint.name;

    auto notify = [this](StageEvent event, std::string_view detail) {
        if (on_stage_) on_stage_(event, detail);
    };

    const auto start = steady_clock::now();
    auto finish = [&outcome, start]() -> TestOutcome {
        outcome.duration = steady_clock::now() - start;
        return outcome;
    };

    notify(StageEvent::AuthStarted, endpoint.name);
    spdlog::debug("[{}] acquiring token (timeout {}ms)", endpoint.name, timeouts_.auth.count());

    auto token = tokens_.acquire(endpoint.credentials, timeouts_.auth, stop);
    check_interrupted(stop);

    if (!token || token->empty()) {
        outcome.error_message =
            std::format("Authentication failed: {}", token ? "received empty token" : token.error());
        spdlog::debug("[{}] {}", endpoint.name, outcome.error_message);
        return finish();
    }

    outcome.auth_succeeded = true;
    notify(StageEvent::AuthSucceeded, endpoint.name);

    const auto& body = method_allows_body(endpoint.method) ? endpoint.request_body : no_body;

    notify(StageEvent::RequestStarted, endpoint.url);
    spdlog::debug("[{}] {} {} (timeout {}ms)",
                  endpoint.name, to_string(endpoint.method), endpoint.url, timeouts_.request.count());

    auto response = api_.call(endpoint.method, endpoint.url, *token, body, timeouts_.request, stop);
    check_interrupted(stop);

    if (!response) {
        outcome.error_message = std::format("Request failed: {}", response.error());
        spdlog::debug("[{}] {}", endpoint.name, outcome.error_message);
        return finish();
    }

    outcome.connect_succeeded = true;
    outcome.status_code = response->status_code;
    notify(StageEvent::RequestCompleted, std::to_string(response->status_code));

    if (response->is_success()) {
        outcome.response_succeeded = true;
        outcome.overall_succeeded = true;
    } else {
        outcome.error_message = std::format("Unexpected status code: {}", response->status_code);
        if (!response->body.empty()) {
            notify(StageEvent::ResponseBody,
                   truncate_for_display(response->body_as_string(), Config::BODY_PREVIEW_LIMIT));
        }
    }

    return finish();
}

}  // namespace authprobe
