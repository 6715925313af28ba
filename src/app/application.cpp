/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "include/api_client.hpp"
#include "include/cli_renderer.hpp"
#include "include/color.hpp"
#include "include/endpoint_config.hpp"
#include "include/http_client.hpp"
#include "include/http_context.hpp"
#include "include/interrupts.hpp"
#include "include/logging.hpp"
#include "include/run_orchestrator.hpp"
#include "include/token_provider.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;

namespace {

std::expected<std::chrono::seconds, std::string> parse_timeout(std::string_view flag,
                                                               std::string_view value) {
    auto seconds = parse_number<long>(value);
    if (!seconds || *seconds <= 0 || *seconds > Config::MAX_TIMEOUT_SEC) {
        return std::unexpected(
            std::format("{} requires a positive number of seconds up to {}, got '{}'",
                        flag, Config::MAX_TIMEOUT_SEC, value));
    }
    return std::chrono::seconds(*seconds);
}

}  // namespace

std::expected<CliOptions, std::string> parse_arguments(int argc, const char* const argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto next_value = [&]() -> std::expected<std::string_view, std::string> {
            if (i + 1 >= argc) {
                return std::unexpected(std::format("Option '{}' requires a value", arg));
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());
            options.config_path = std::string(*value);
        } else if (arg == "--auth-timeout" || arg == "--request-timeout") {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());
            auto timeout = parse_timeout(arg, *value);
            if (!timeout) return std::unexpected(timeout.error());
            if (arg == "--auth-timeout") {
                options.timeouts.auth = *timeout;
            } else {
                options.timeouts.request = *timeout;
            }
        } else if (arg == "--log-level") {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());
            options.log_level = std::string(*value);
        } else {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
    }

    return options;
}

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options]", app_name);
    std::println("");
    std::println("Checks that OAuth 2.0 protected API endpoints authenticate, connect and");
    std::println("answer with a 2xx status.");
    std::println("");
    std::println("Options:");
    std::println("  -c, --config <path>         Endpoint configuration file (default: {})",
                 Config::DEFAULT_CONFIG_PATH);
    std::println("  -v, --verbose               Show each stage while it runs");
    std::println("      --auth-timeout <sec>    Token request deadline (default: {})",
                 Config::AUTH_TIMEOUT_SEC);
    std::println("      --request-timeout <sec> API request deadline (default: {})",
                 Config::REQUEST_TIMEOUT_SEC);
    std::println("      --log-level <level>     trace|debug|info|warn|error|critical|off (default: {})",
                 Config::DEFAULT_LOG_LEVEL);
    std::println("  -h, --help                  Show this help message");
    std::println("      --version               Show version information");
    std::println("");
    std::println("Exit status is 0 when every endpoint passes and 1 otherwise.");
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

int Application::run(int argc, char* argv[]) {
    try {
        SignalGuard signal_guard;

        std::string app_name{Config::APP_NAME};
        if (argc > 0) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        auto options = parse_arguments(argc, argv);
        if (!options) {
            std::println(stderr, "{}Error: {}{}", Color::RED, options.error(), Color::RESET);
            show_help(app_name);
            return 1;
        }
        if (options->show_help) {
            show_help(app_name);
            return 0;
        }
        if (options->show_version) {
            show_version();
            return 0;
        }

        if (auto logging = init_logging(options->log_level); !logging) {
            std::println(stderr, "{}Error: {}{}", Color::RED, logging.error(), Color::RESET);
            return 1;
        }

        HttpContext http_context;

        auto endpoints = authprobe::load_config(options->config_path);
        if (!endpoints) {
            std::println(stderr,
                         "{}Failed to load configuration: {}{}",
                         Color::RED,
                         endpoints.error(),
                         Color::RESET);
            return 1;
        }

        CliRenderer::render_banner(endpoints->size());

        authprobe::HttpClient http;
        authprobe::EntraTokenProvider tokens(http);
        authprobe::ApiClient api(http);

        authprobe::EndpointTester tester(
            tokens,
            api,
            options->timeouts,
            options->verbose ? CliRenderer::make_stage_callback() : authprobe::StageCallback{});
        authprobe::RunOrchestrator orchestrator(tester, CliRenderer::make_run_observer());

        auto report = orchestrator.run(*endpoints, signal_guard.token());
        CliRenderer::render_summary(report.summary);

        return report.has_failures() ? 1 : 0;

    } catch (const InterruptedError& e) {
        std::println(stderr, "\n{}Run aborted: {}{}", Color::RED, e.what(), Color::RESET);
        return 1;
    } catch (const std::exception& e) {
        std::println(stderr, "\n{}Fatal Error: {}{}", Color::RED, e.what(), Color::RESET);
        return 1;
    }
}
