/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <functional>
#include <stop_token>
#include <string_view>

#include "include/api_client.hpp"
#include "include/config.hpp"
#include "include/endpoint_config.hpp"
#include "include/results.hpp"
#include "include/token_provider.hpp"

namespace authprobe {

enum class StageEvent { AuthStarted, AuthSucceeded, RequestStarted, RequestCompleted, ResponseBody };
using StageCallback = std::function<void(StageEvent, std::string_view)>;

struct StageTimeouts {
    std::chrono::milliseconds auth{std::chrono::seconds(Config::AUTH_TIMEOUT_SEC)};
    std::chrono::milliseconds request{std::chrono::seconds(Config::REQUEST_TIMEOUT_SEC)};
};

/**
 * Runs the authenticate -> invoke -> classify sequence for one endpoint.
 *
 * Each stage is attempted once and only after the previous one succeeded,
 * so the stage flags of the returned outcome always form a prefix. The
 * token lives only for the duration of run(). If stop is requested while a
 * stage is in flight, InterruptedError propagates and no outcome is produced.
 *
 * on_stage receives progress notifications; leave it empty for quiet runs.
 */
class EndpointTester {
    TokenAcquirer& tokens_;
    ApiInvoker& api_;
    StageTimeouts timeouts_;
    StageCallback on_stage_;

   public:
    EndpointTester(TokenAcquirer& tokens,
                   ApiInvoker& api,
                   StageTimeouts timeouts = {},
                   StageCallback on_stage = {});

    [[nodiscard]] TestOutcome run(const EndpointDefinition& endpoint, std::stop_token stop = {}) const;
};

}  // namespace authprobe
