/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <chrono>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "include/interrupts.hpp"
#include "include/run_orchestrator.hpp"
#include "support/test_doubles.hpp"

using namespace authprobe;
using authprobe::testing::make_endpoint;
using authprobe::testing::make_response;
using authprobe::testing::MockApiInvoker;
using authprobe::testing::MockTokenAcquirer;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

using TokenResult = std::expected<std::string, std::string>;
using CallResult = std::expected<HttpResponse, std::string>;

TestOutcome outcome_with(bool auth, bool connect, bool response) {
    TestOutcome outcome;
    outcome.auth_succeeded = auth;
    outcome.connect_succeeded = auth && connect;
    outcome.response_succeeded = auth && connect && response;
    outcome.overall_succeeded = outcome.response_succeeded;
    return outcome;
}

class RunOrchestratorTest : public ::testing::Test {
   protected:
    RunOrchestratorTest() {
        ON_CALL(tokens_, acquire(_, _, _)).WillByDefault(Return(TokenResult("tok")));
    }

    void respond(const std::string& url, CallResult result) {
        ON_CALL(api_, call(_, url, _, _, _, _)).WillByDefault(Return(result));
    }

    NiceMock<MockTokenAcquirer> tokens_;
    NiceMock<MockApiInvoker> api_;
    EndpointTester tester_{tokens_, api_};
};

}  // namespace

TEST(SummarizeTest, EmptyRunHasZeroCounts) {
    auto summary = summarize({});

    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(summary.passed, 0u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_DOUBLE_EQ(summary.passed_percent(), 0.0);
    EXPECT_DOUBLE_EQ(summary.failed_percent(), 0.0);
}

TEST(SummarizeTest, EachFailureLandsInItsEarliestBucket) {
    std::vector<TestOutcome> outcomes = {
        outcome_with(false, false, false),
        outcome_with(true, false, false),
        outcome_with(true, false, false),
        outcome_with(true, true, false),
        outcome_with(true, true, true),
        outcome_with(true, true, true),
    };

    auto summary = summarize(outcomes);

    EXPECT_EQ(summary.total, 6u);
    EXPECT_EQ(summary.passed, 2u);
    EXPECT_EQ(summary.failed, 4u);
    EXPECT_EQ(summary.auth_failures, 1u);
    EXPECT_EQ(summary.connect_failures, 2u);
    EXPECT_EQ(summary.response_failures, 1u);
    EXPECT_EQ(summary.passed + summary.failed, summary.total);
    EXPECT_EQ(summary.auth_failures + summary.connect_failures + summary.response_failures, summary.failed);
    EXPECT_NEAR(summary.passed_percent(), 33.333, 0.001);
    EXPECT_NEAR(summary.failed_percent(), 66.667, 0.001);
}

TEST_F(RunOrchestratorTest, NotFoundThenCreatedCountsOneResponseFailure) {
    respond("https://api.example.com/missing", CallResult(make_response(404)));
    respond("https://api.example.com/created", CallResult(make_response(201)));

    RunOrchestrator orchestrator(tester_);
    auto report = orchestrator.run({make_endpoint("Missing", "https://api.example.com/missing"),
                                    make_endpoint("Created", "https://api.example.com/created")});

    EXPECT_EQ(report.summary.total, 2u);
    EXPECT_EQ(report.summary.passed, 1u);
    EXPECT_EQ(report.summary.failed, 1u);
    EXPECT_EQ(report.summary.response_failures, 1u);
    EXPECT_EQ(report.summary.auth_failures, 0u);
    EXPECT_EQ(report.summary.connect_failures, 0u);
    EXPECT_TRUE(report.has_failures());
}

TEST_F(RunOrchestratorTest, FailuresDoNotStopTheRun) {
    EXPECT_CALL(tokens_, acquire(_, _, _))
        .WillOnce(Return(TokenResult(std::unexpect, "invalid_client")))
        .WillOnce(Return(TokenResult("tok")))
        .WillOnce(Return(TokenResult("tok")));
    respond("https://b.example.com", CallResult(std::unexpect, "network error: connection refused"));
    respond("https://c.example.com", CallResult(make_response(200)));

    RunOrchestrator orchestrator(tester_);
    auto report = orchestrator.run({make_endpoint("A", "https://a.example.com"),
                                    make_endpoint("B", "https://b.example.com"),
                                    make_endpoint("C", "https://c.example.com")});

    ASSERT_EQ(report.outcomes.size(), 3u);
    EXPECT_EQ(report.outcomes[0].endpoint_name, "A");
    EXPECT_EQ(report.outcomes[1].endpoint_name, "B");
    EXPECT_EQ(report.outcomes[2].endpoint_name, "C");
    EXPECT_EQ(report.summary.auth_failures, 1u);
    EXPECT_EQ(report.summary.connect_failures, 1u);
    EXPECT_EQ(report.summary.passed, 1u);
}

TEST_F(RunOrchestratorTest, AllPassingRunHasNoFailures) {
    respond("https://api.example.com/one", CallResult(make_response(200)));
    respond("https://api.example.com/two", CallResult(make_response(204)));

    RunOrchestrator orchestrator(tester_);
    auto report = orchestrator.run({make_endpoint("One", "https://api.example.com/one"),
                                    make_endpoint("Two", "https://api.example.com/two")});

    EXPECT_EQ(report.summary.passed, 2u);
    EXPECT_FALSE(report.has_failures());
    EXPECT_DOUBLE_EQ(report.summary.passed_percent(), 100.0);
}

TEST_F(RunOrchestratorTest, ObserverSeesEveryEndpointInOrder) {
    respond("https://api.example.com/one", CallResult(make_response(200)));
    respond("https://api.example.com/two", CallResult(make_response(500)));

    std::vector<std::string> calls;
    RunObserver observer;
    observer.on_start = [&calls](std::size_t index, std::size_t total, const EndpointDefinition& endpoint) {
        calls.push_back(std::to_string(index) + "/" + std::to_string(total) + " " + endpoint.name);
    };
    observer.on_finish = [&calls](const TestOutcome& outcome) {
        calls.push_back(outcome.endpoint_name + (outcome.overall_succeeded ? " pass" : " fail"));
    };

    RunOrchestrator orchestrator(tester_, observer);
    (void)orchestrator.run({make_endpoint("One", "https://api.example.com/one"),
                            make_endpoint("Two", "https://api.example.com/two")});

    EXPECT_THAT(calls, ::testing::ElementsAre("0/2 One", "One pass", "1/2 Two", "Two fail"));
}

TEST_F(RunOrchestratorTest, StopBetweenEndpointsAbortsWithoutSummary) {
    std::stop_source source;
    respond("https://api.example.com/one", CallResult(make_response(200)));

    RunObserver observer;
    observer.on_finish = [&source](const TestOutcome&) { source.request_stop(); };

    EXPECT_CALL(api_, call(_, "https://api.example.com/two", _, _, _, _)).Times(0);

    RunOrchestrator orchestrator(tester_, observer);
    EXPECT_THROW((void)orchestrator.run({make_endpoint("One", "https://api.example.com/one"),
                                         make_endpoint("Two", "https://api.example.com/two")},
                                        source.get_token()),
                 InterruptedError);
}
