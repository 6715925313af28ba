/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/token_provider.hpp"

#include <cctype>
#include <format>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "include/interrupts.hpp"
#include "include/utils.hpp"

using json = nlohmann::json;

namespace authprobe {

namespace {

std::string_view strip_trailing_slash(std::string_view text) {
    while (!text.empty() && text.back() == '/') {
        text.remove_suffix(1);
    }
    return text;
}

std::expected<void, std::string> check_credentials(const ClientCredentials& credentials) {
    if (credentials.tenant_id.empty()) return std::unexpected("tenantId is empty");
    if (credentials.client_id.empty()) return std::unexpected("clientId is empty");
    if (credentials.client_secret.empty()) return std::unexpected("clientSecret is empty");
    if (credentials.scope.empty()) return std::unexpected("scope is empty");
    return {};
}

std::string describe_error_reply(const HttpResponse& response) {
    auto body = response.body_as_json();
    if (body && body->is_object() && body->contains("error")) {
        const json& error = body->at("error");
        std::string code = error.is_string() ? error.get<std::string>() : error.dump();
        std::string description;
        if (auto it = body->find("error_description"); it != body->end() && it->is_string()) {
            description = it->get<std::string>();
        }
        if (description.empty()) {
            return std::format("{} (HTTP {})", code, response.status_code);
        }
        return std::format("{}: {} (HTTP {})",
                           code,
                           truncate_for_display(description, Config::BODY_PREVIEW_LIMIT),
                           response.status_code);
    }

    if (response.body.empty()) {
        return std::format("HTTP {}", response.status_code);
    }
    return std::format("HTTP {}: {}",
                       response.status_code,
                       truncate_for_display(response.body, Config::BODY_PREVIEW_LIMIT));
}

}  // namespace

std::string url_encode(std::string_view text) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;

    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return encoded.str();
}

std::string build_token_request_body(const ClientCredentials& credentials) {
    return std::format("grant_type=client_credentials&client_id={}&client_secret={}&scope={}",
                       url_encode(credentials.client_id),
                       url_encode(credentials.client_secret),
                       url_encode(credentials.scope));
}

std::expected<std::string, std::string> parse_token_response(const HttpResponse& response) {
    if (!response.is_success()) {
        return std::unexpected(
            std::format("failed to acquire token: {}", describe_error_reply(response)));
    }

    auto body = response.body_as_json();
    if (!body) {
        return std::unexpected(std::format("failed to acquire token: {}", body.error()));
    }
    if (!body->is_object()) {
        return std::unexpected("failed to acquire token: token response is not a JSON object");
    }

    auto token = body->find("access_token");
    if (token == body->end() || !token->is_string() || token->get_ref<const std::string&>().empty()) {
        return std::unexpected("received empty token");
    }
    return token->get<std::string>();
}

EntraTokenProvider::EntraTokenProvider(HttpTransport& http, std::string authority_host)
    : http_(http), authority_host_(std::move(authority_host)) {}

std::string EntraTokenProvider::token_endpoint(std::string_view tenant) const {
    if (tenant.starts_with("https://") || tenant.starts_with("http://")) {
        return std::format("{}{}", strip_trailing_slash(tenant), Config::TOKEN_PATH);
    }
    return std::format("{}/{}{}",
                       strip_trailing_slash(authority_host_),
                       url_encode(tenant),
                       Config::TOKEN_PATH);
}

std::expected<std::string, std::string> EntraTokenProvider::acquire(
    const ClientCredentials& credentials, std::chrono::milliseconds timeout, std::stop_token stop) {
    if (auto valid = check_credentials(credentials); !valid) {
        return std::unexpected(std::format("failed to create credential: {}", valid.error()));
    }

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = token_endpoint(credentials.tenant_id);
    request.body = build_token_request_body(credentials);
    request.timeout = timeout;
    request.add_header("Content-Type", "application/x-www-form-urlencoded");
    request.add_header("Accept", "application/json");

    spdlog::debug("Requesting token for client {} from {}", credentials.client_id, request.url);

    auto response = http_.execute(request, stop);
    check_interrupted(stop);
    if (!response) {
        return std::unexpected(std::format("failed to acquire token: {}", response.error()));
    }

    return parse_token_response(*response);
}

}  // namespace authprobe
