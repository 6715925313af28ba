// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace authprobe {

enum class Stage { Authentication, Connectivity, Response };

struct TestOutcome {
    std::string endpoint_name;
    bool auth_succeeded = false;
    bool connect_succeeded = false;
    bool response_succeeded = false;
    long status_code = 0;
    std::string error_message;
    std::chrono::nanoseconds duration{0};
    bool overall_succeeded = false;

    // Earliest stage that did not succeed, if any.
    [[nodiscard]] std::optional<Stage> failed_stage() const noexcept {
        if (!auth_succeeded) return Stage::Authentication;
        if (!connect_succeeded) return Stage::Connectivity;
        if (!response_succeeded) return Stage::Response;
        return std::nullopt;
    }
};

struct RunSummary {
    std::size_t total = 0;
    std::size_t passed = 0;
    std::size_t failed = 0;
    std::size_t auth_failures = 0;
    std::size_t connect_failures = 0;
    std::size_t response_failures = 0;

    [[nodiscard]] double passed_percent() const noexcept {
        return total == 0 ? 0.0 : static_cast<double>(passed) * 100.0 / static_cast<double>(total);
    }

    [[nodiscard]] double failed_percent() const noexcept {
        return total == 0 ? 0.0 : static_cast<double>(failed) * 100.0 / static_cast<double>(total);
    }
};

struct RunReport {
    std::vector<TestOutcome> outcomes;
    RunSummary summary;

    [[nodiscard]] bool has_failures() const noexcept { return summary.failed > 0; }
};

}  // namespace authprobe
