/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <string>

#include "include/endpoint_config.hpp"
#include "include/endpoint_tester.hpp"
#include "include/results.hpp"
#include "include/run_orchestrator.hpp"

namespace CliRenderer {
void render_banner(std::size_t endpoint_count);
void render_endpoint_header(std::size_t index,
                            std::size_t total,
                            const authprobe::EndpointDefinition& endpoint);
void render_outcome(const authprobe::TestOutcome& outcome);
void render_summary(const authprobe::RunSummary& summary);

std::string format_outcome(const authprobe::TestOutcome& outcome);
std::string format_summary(const authprobe::RunSummary& summary);

authprobe::StageCallback make_stage_callback();
authprobe::RunObserver make_run_observer();
}  // namespace CliRenderer
