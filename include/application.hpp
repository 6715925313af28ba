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

#include "include/config.hpp"
#include "include/endpoint_tester.hpp"

struct CliOptions {
    std::string config_path{Config::DEFAULT_CONFIG_PATH};
    std::string log_level{Config::DEFAULT_LOG_LEVEL};
    authprobe::StageTimeouts timeouts;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

std::expected<CliOptions, std::string> parse_arguments(int argc, const char* const argv[]);

class Application {
   public:
    int run(int argc, char* argv[]);

   private:
    void show_help(const std::string& app_name) const;
    void show_version() const;
};
