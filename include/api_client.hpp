/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

#include <nlohmann/json.hpp>

#include "include/http_client.hpp"
#include "include/http_types.hpp"

namespace authprobe {

// Issues one authenticated API call. Any HTTP status is a successful call;
// only transport-level problems are failures.
class ApiInvoker {
   public:
    virtual ~ApiInvoker() = default;

    virtual std::expected<HttpResponse, std::string> call(
        HttpMethod method,
        const std::string& url,
        const std::string& access_token,
        const std::optional<nlohmann::json>& body,
        std::chrono::milliseconds timeout,
        std::stop_token stop) = 0;
};

class ApiClient final : public ApiInvoker {
    HttpTransport& http_;

   public:
    explicit ApiClient(HttpTransport& http);

    // Sends "Authorization: Bearer <token>". A body is serialised and sent
    // with "Content-Type: application/json" only for POST, PUT and PATCH.
    std::expected<HttpResponse, std::string> call(
        HttpMethod method,
        const std::string& url,
        const std::string& access_token,
        const std::optional<nlohmann::json>& body,
        std::chrono::milliseconds timeout,
        std::stop_token stop) override;
};

}  // namespace authprobe
