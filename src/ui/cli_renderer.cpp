#include "include/cli_renderer.hpp"

#include <format>
#include <iostream>
#include <print>
#include <string>
#include <string_view>

#include "include/color.hpp"
#include "include/config.hpp"
#include "include/utils.hpp"

using namespace authprobe;

namespace CliRenderer {

namespace {

void append_line(std::string& out, std::string_view text) {
    out.append(text);
    out.push_back('\n');
}

}

void render_banner(std::size_t endpoint_count) {
    std::println("Loaded configuration with {} endpoint(s)", endpoint_count);
    print_line('=');
}

void render_endpoint_header(std::size_t index, std::size_t total, const EndpointDefinition& endpoint) {
    std::println("\n[{}/{}] Testing: {}", index + 1, total, Color::colorize(endpoint.name, Color::BOLD));
    std::println("    URL: {}", Color::colorize(endpoint.url, Color::CYAN));
    std::println("    Method: {}", Color::colorize(to_string(endpoint.method), Color::YELLOW));
    std::cout << std::flush;
}

std::string format_outcome(const TestOutcome& outcome) {
    std::string out;
    const std::string elapsed = format_duration(outcome.duration);

    if (outcome.overall_succeeded) {
        append_line(out, std::format("    {} {} - All checks passed (Duration: {})",
                                     Color::status_mark(true),
                                     Color::colorize("PASS", Color::GREEN),
                                     elapsed));
        return out;
    }

    append_line(out, std::format("    {} {} - {} (Duration: {})",
                                 Color::status_mark(false),
                                 Color::colorize("FAIL", Color::RED),
                                 outcome.error_message,
                                 elapsed));

    const int width = Config::BREAKDOWN_LABEL_WIDTH - 12;
    append_line(out, std::format("      \u2022 {:<{}} {}", "Authentication:", width,
                                 Color::pass_fail(outcome.auth_succeeded)));
    append_line(out, std::format("      \u2022 {:<{}} {}", "Connectivity:", width,
                                 Color::pass_fail(outcome.connect_succeeded)));
    if (outcome.connect_succeeded) {
        append_line(out, std::format("      \u2022 {:<{}} {} (Status Code: {})", "Response Status:", width,
                                     Color::pass_fail(outcome.response_succeeded),
                                     outcome.status_code));
    }
    return out;
}

std::string format_summary(const RunSummary& summary) {
    std::string out;
    const int width = Config::SUMMARY_LABEL_WIDTH;

    append_line(out, Color::colorize("SUMMARY", Color::BOLD));
    append_line(out, std::string(Config::TERM_WIDTH, '-'));
    append_line(out, std::format("{:<{}} {}", "Total Endpoints:", width, summary.total));
    append_line(out, std::format("{:<{}} {} ({:.1f}%)", "Passed:", width,
                                 Color::colorize(std::to_string(summary.passed), Color::GREEN),
                                 summary.passed_percent()));
    append_line(out, std::format("{:<{}} {} ({:.1f}%)", "Failed:", width,
                                 Color::colorize(std::to_string(summary.failed),
                                                 summary.failed > 0 ? Color::RED : Color::GREEN),
                                 summary.failed_percent()));
    append_line(out, "");

    const int bucket_width = Config::BREAKDOWN_LABEL_WIDTH;
    append_line(out, std::format("  \u2022 {:<{}} {}", "Authentication Failures:", bucket_width,
                                 summary.auth_failures));
    append_line(out, std::format("  \u2022 {:<{}} {}", "Connectivity Failures:", bucket_width,
                                 summary.connect_failures));
    append_line(out, std::format("  \u2022 {:<{}} {}", "Response Failures:", bucket_width,
                                 summary.response_failures));
    append_line(out, std::string(Config::TERM_WIDTH, '='));
    return out;
}

void render_outcome(const TestOutcome& outcome) {
    std::print("{}", format_outcome(outcome));
    std::cout << std::flush;
}

void render_summary(const RunSummary& summary) {
    std::println("");
    print_line('=');
    std::print("{}", format_summary(summary));
    std::cout << std::flush;
}

StageCallback make_stage_callback() {
    return [](StageEvent event, std::string_view detail) {
        switch (event) {
            case StageEvent::AuthStarted:
                std::println("    \u2192 Authenticating...");
                break;
            case StageEvent::AuthSucceeded:
                std::println("    {} Authentication successful", Color::status_mark(true));
                break;
            case StageEvent::RequestStarted:
                std::println("    \u2192 Making API request...");
                break;
            case StageEvent::RequestCompleted:
                std::println("    {} Request completed (Status: {})", Color::status_mark(true), detail);
                break;
            case StageEvent::ResponseBody:
                std::println("    Response body: {}", detail);
                break;
        }
        std::cout << std::flush;
    };
}

RunObserver make_run_observer() {
    RunObserver observer;
    observer.on_start = [](std::size_t index, std::size_t total, const EndpointDefinition& endpoint) {
        render_endpoint_header(index, total, endpoint);
    };
    observer.on_finish = [](const TestOutcome& outcome) { render_outcome(outcome); };
    return observer;
}

}  // namespace CliRenderer
