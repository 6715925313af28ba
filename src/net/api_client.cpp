/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/api_client.hpp"

#include <format>

#include "include/interrupts.hpp"

using json = nlohmann::json;

namespace authprobe {

ApiClient::ApiClient(HttpTransport& http) : http_(http) {}

std::expected<HttpResponse, std::string> ApiClient::call(HttpMethod method,
                                                         const std::string& url,
                                                         const std::string& access_token,
                                                         const std::optional<json>& body,
                                                         std::chrono::milliseconds timeout,
                                                         std::stop_token stop) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.timeout = timeout;

    if (body && method_allows_body(method)) {
        try {
            request.body = body->dump(-1, ' ', false, json::error_handler_t::strict);
        } catch (const json::type_error& e) {
            return std::unexpected(std::format("failed to marshal request body: {}", e.what()));
        }
    }

    request.add_header("Authorization", std::format("Bearer {}", access_token));
    if (request.body) {
        request.add_header("Content-Type", "application/json");
    }

    auto response = http_.execute(request, stop);
    check_interrupted(stop);
    if (!response) {
        return std::unexpected(std::format("failed to execute request: {}", response.error()));
    }
    return response;
}

}  // namespace authprobe
