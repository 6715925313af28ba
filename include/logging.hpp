/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>
#include <string_view>

// Installs the process-wide stderr logger. Accepts spdlog level names
// (trace, debug, info, warn, error, critical, off).
std::expected<void, std::string> init_logging(std::string_view level);
