/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/logging.hpp"

#include <array>
#include <format>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "include/config.hpp"

std::expected<void, std::string> init_logging(std::string_view level) {
    static constexpr std::array known = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};

    bool valid = false;
    for (std::string_view name : known) {
        if (name == level) valid = true;
    }
    if (!valid) {
        return std::unexpected(std::format("unknown log level '{}'", level));
    }

    const std::string logger_name(Config::APP_NAME);
    spdlog::drop(logger_name);
    auto logger = spdlog::stderr_color_mt(logger_name);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(std::string(level)));
    return {};
}
