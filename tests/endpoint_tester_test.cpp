/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "include/endpoint_tester.hpp"
#include "include/interrupts.hpp"
#include "support/test_doubles.hpp"

using namespace authprobe;
using authprobe::testing::make_endpoint;
using authprobe::testing::make_response;
using authprobe::testing::MockApiInvoker;
using authprobe::testing::MockTokenAcquirer;
using ::testing::_;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Optional;
using ::testing::Return;
using ::testing::StartsWith;
using namespace std::chrono_literals;

namespace {

using TokenResult = std::expected<std::string, std::string>;
using CallResult = std::expected<HttpResponse, std::string>;

TokenResult token_ok(std::string token = "eyJ0eXAi") {
    return TokenResult(std::move(token));
}

TokenResult token_error(std::string message) {
    return TokenResult(std::unexpect, std::move(message));
}

CallResult call_error(std::string message) {
    return CallResult(std::unexpect, std::move(message));
}

class EndpointTesterTest : public ::testing::Test {
   protected:
    NiceMock<MockTokenAcquirer> tokens_;
    NiceMock<MockApiInvoker> api_;
};

}  // namespace

TEST_F(EndpointTesterTest, HealthyEndpointPassesAllStages) {
    auto endpoint = make_endpoint("Users", "https://api.example.com/users");

    EXPECT_CALL(tokens_, acquire(_, _, _)).WillOnce(Return(token_ok("tok-123")));
    EXPECT_CALL(api_, call(HttpMethod::Get, "https://api.example.com/users", "tok-123", Eq(std::nullopt), _, _))
        .WillOnce(Return(CallResult(make_response(200, R"({"value":[]})"))));

    EndpointTester tester(tokens_, api_);
    auto outcome = tester.run(endpoint);

    EXPECT_EQ(outcome.endpoint_name, "Users");
    EXPECT_TRUE(outcome.auth_succeeded);
    EXPECT_TRUE(outcome.connect_succeeded);
    EXPECT_TRUE(outcome.response_succeeded);
    EXPECT_TRUE(outcome.overall_succeeded);
    EXPECT_EQ(outcome.status_code, 200);
    EXPECT_TRUE(outcome.error_message.empty());
    EXPECT_FALSE(outcome.failed_stage().has_value());
}

TEST_F(EndpointTesterTest, AuthenticationFailureSkipsRequest) {
    auto endpoint = make_endpoint("Orders", "https://api.example.com/orders");

    EXPECT_CALL(tokens_, acquire(_, _, _))
        .WillOnce(Return(token_error("failed to acquire token: invalid_client: AADSTS7000215 (HTTP 401)")));
    EXPECT_CALL(api_, call).Times(0);

    EndpointTester tester(tokens_, api_);
    auto outcome = tester.run(endpoint);

    EXPECT_FALSE(outcome.auth_succeeded);
    EXPECT_FALSE(outcome.connect_succeeded);
    EXPECT_FALSE(outcome.response_succeeded);
    EXPECT_FALSE(outcome.overall_succeeded);
    EXPECT_EQ(outcome.status_code, 0);
    EXPECT_EQ(outcome.error_message,
              "Authentication failed: failed to acquire token: invalid_client: AADSTS7000215 (HTTP 401)");
    EXPECT_THAT(outcome.failed_stage(), Optional(Stage::Authentication));
}

TEST_F(EndpointTesterTest, EmptyTokenIsAnAuthenticationFailure) {
    EXPECT_CALL(tokens_, acquire(_, _, _)).WillOnce(Return(token_ok("")));
    EXPECT_CALL(api_, call).Times(0);

    EndpointTester tester(tokens_, api_);
    auto outcome = tester.run(make_endpoint("Empty", "https://api.example.com"));

    EXPECT_FALSE(outcome.auth_succeeded);
    EXPECT_EQ(outcome.error_message, "Authentication failed: received empty token");
}

TEST_F(EndpointTesterTest, TransportTimeoutIsAConnectivityFailure) {
    EXPECT_CALL(tokens_, acquire(_, _, _)).WillOnce(Return(token_ok()));
    EXPECT_CALL(api_, call)
        .WillOnce(Return(call_error("failed to execute request: deadline exceeded after 30000ms: Operation timed out")));

    EndpointTester tester(tokens_, api_);
    auto outcome = tester.run(make_endpoint("Slow", "https://slow.example.com"));

    EXPECT_TRUE(outcome.auth_succeeded);
    EXPECT_FALSE(outcome.connect_succeeded);
    EXPECT_FALSE(outcome.response_succeeded);
    EXPECT_EQ(outcome.status_code, 0);
    EXPECT_THAT(outcome.error_message, StartsWith("Request failed: "));
    EXPECT_THAT(outcome.error_message, HasSubstr("deadline exceeded"));
    EXPECT_THAT(outcome.failed_stage(), Optional(Stage::Connectivity));
}

TEST_F(EndpointTesterTest, StageTimeoutsArePassedThrough) {
    StageTimeouts timeouts{5s, 12s};

    EXPECT_CALL(tokens_, acquire(_, std::chrono::milliseconds(5s), _)).WillOnce(Return(token_ok()));
    EXPECT_CALL(api_, call(_, _, _, _, std::chrono::milliseconds(12s), _))
        .WillOnce(Return(CallResult(make_response(204))));

    EndpointTester tester(tokens_, api_, timeouts);
    EXPECT_TRUE(tester.run(make_endpoint("Timeouts", "https://api.example.com")).overall_succeeded);
}

struct StatusCase {
    long status;
    bool passes;
};

class StatusBoundaryTest : public EndpointTesterTest, public ::testing::WithParamInterface<StatusCase> {};

TEST_P(StatusBoundaryTest, OnlyTwoHundredRangePasses) {
    const auto [status, passes] = GetParam();

    EXPECT_CALL(tokens_, acquire(_, _, _)).WillOnce(Return(token_ok()));
    EXPECT_CALL(api_, call).WillOnce(Return(CallResult(make_response(status))));

    EndpointTester tester(tokens_, api_);
    auto outcome = tester.run(make_endpoint("Boundary", "https://api.example.com"));

    EXPECT_TRUE(outcome.auth_succeeded);
    EXPECT_TRUE(outcome.connect_succeeded);
    EXPECT_EQ(outcome.status_code, status);
    EXPECT_EQ(outcome.response_succeeded, passes);
    EXPECT_EQ(outcome.overall_succeeded, passes);
    if (passes) {
        EXPECT_TRUE(outcome.error_message.empty());
    } else {
        EXPECT_EQ(outcome.error_message, "Unexpected status code: " + std::to_string(status));
    }
}

INSTANTIATE_TEST_SUITE_P(Statuses,
                         StatusBoundaryTest,
                         ::testing::Values(StatusCase{199, false},
                                           StatusCase{200, true},
                                           StatusCase{201, true},
                                           StatusCase{299, true},
                                           StatusCase{300, false},
                                           StatusCase{404, false},
                                           StatusCase{500, false}));

TEST_F(EndpointTesterTest, BodyIsOnlyForwardedForMethodsThatCarryOne) {
    const nlohmann::json body = {{"key", "value"}};

    for (auto method : {HttpMethod::Get, HttpMethod::Post, HttpMethod::Put, HttpMethod::Patch, HttpMethod::Delete}) {
        auto endpoint = make_endpoint("Body", "https://api.example.com", method);
        endpoint.request_body = body;

        std::optional<nlohmann::json> forwarded;
        EXPECT_CALL(tokens_, acquire(_, _, _)).WillOnce(Return(token_ok()));
        EXPECT_CALL(api_, call(method, _, _, _, _, _))
            .WillOnce(Invoke([&forwarded](HttpMethod, const std::string&, const std::string&,
                                          const std::optional<nlohmann::json>& sent,
                                          std::chrono::milliseconds, std::stop_token) {
                forwarded = sent;
                return CallResult(make_response(200));
            }));

        EndpointTester tester(tokens_, api_);
        EXPECT_TRUE(tester.run(endpoint).overall_succeeded);

        if (method_allows_body(method)) {
            EXPECT_EQ(forwarded, std::optional<nlohmann::json>(body)) << to_string(method);
        } else {
            EXPECT_FALSE(forwarded.has_value()) << to_string(method);
        }
        ::testing::Mock::VerifyAndClearExpectations(&api_);
        ::testing::Mock::VerifyAndClearExpectations(&tokens_);
    }
}

TEST_F(EndpointTesterTest, StageCallbackFollowsTheFlow) {
    std::vector<std::pair<StageEvent, std::string>> events;
    StageCallback record = [&events](StageEvent event, std::string_view detail) {
        events.emplace_back(event, std::string(detail));
    };

    EXPECT_CALL(tokens_, acquire(_, _, _)).WillOnce(Return(token_ok()));
    EXPECT_CALL(api_, call).WillOnce(Return(CallResult(make_response(503, "upstream unavailable\n"))));

    EndpointTester tester(tokens_, api_, {}, record);
    auto outcome = tester.run(make_endpoint("Flaky", "https://flaky.example.com/health"));

    EXPECT_FALSE(outcome.response_succeeded);
    ASSERT_EQ(events.size(), 5u);
    EXPECT_EQ(events[0].first, StageEvent::AuthStarted);
    EXPECT_EQ(events[1].first, StageEvent::AuthSucceeded);
    EXPECT_EQ(events[2].first, StageEvent::RequestStarted);
    EXPECT_EQ(events[2].second, "https://flaky.example.com/health");
    EXPECT_EQ(events[3].first, StageEvent::RequestCompleted);
    EXPECT_EQ(events[3].second, "503");
    EXPECT_EQ(events[4].first, StageEvent::ResponseBody);
    EXPECT_EQ(events[4].second, "upstream unavailable");
}

TEST_F(EndpointTesterTest, StageFlagsFormAPrefix) {
    EXPECT_CALL(tokens_, acquire(_, _, _))
        .WillOnce(Return(token_error("boom")))
        .WillOnce(Return(token_ok()))
        .WillOnce(Return(token_ok()))
        .WillOnce(Return(token_ok()));
    EXPECT_CALL(api_, call)
        .WillOnce(Return(call_error("refused")))
        .WillOnce(Return(CallResult(make_response(418))))
        .WillOnce(Return(CallResult(make_response(200))));

    EndpointTester tester(tokens_, api_);
    for (int i = 0; i < 4; ++i) {
        auto outcome = tester.run(make_endpoint("Prefix", "https://api.example.com"));

        EXPECT_TRUE(!outcome.connect_succeeded || outcome.auth_succeeded);
        EXPECT_TRUE(!outcome.response_succeeded || outcome.connect_succeeded);
        EXPECT_EQ(outcome.overall_succeeded, outcome.response_succeeded);
        EXPECT_EQ(outcome.error_message.empty(), outcome.overall_succeeded);
        EXPECT_EQ(outcome.status_code != 0, outcome.connect_succeeded);
    }
}

TEST_F(EndpointTesterTest, StopDuringAuthenticationAbortsTheRun) {
    std::stop_source source;

    EXPECT_CALL(tokens_, acquire(_, _, _)).WillOnce(Invoke([&source](const ClientCredentials&,
                                                                      std::chrono::milliseconds,
                                                                      std::stop_token) {
        source.request_stop();
        return token_ok();
    }));
    EXPECT_CALL(api_, call).Times(0);

    EndpointTester tester(tokens_, api_);
    EXPECT_THROW((void)tester.run(make_endpoint("Stopped", "https://api.example.com"), source.get_token()),
                 InterruptedError);
}

TEST_F(EndpointTesterTest, DurationCoversBothStages) {
    EXPECT_CALL(tokens_, acquire(_, _, _)).WillOnce(Invoke([](const ClientCredentials&,
                                                              std::chrono::milliseconds,
                                                              std::stop_token) {
        std::this_thread::sleep_for(20ms);
        return token_ok();
    }));
    EXPECT_CALL(api_, call).WillOnce(Invoke([](HttpMethod, const std::string&, const std::string&,
                                               const std::optional<nlohmann::json>&,
                                               std::chrono::milliseconds, std::stop_token) {
        std::this_thread::sleep_for(20ms);
        return CallResult(make_response(200));
    }));

    EndpointTester tester(tokens_, api_);
    auto outcome = tester.run(make_endpoint("Timed", "https://api.example.com"));

    EXPECT_GE(outcome.duration, 40ms);
}
