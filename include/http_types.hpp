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
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace authprobe {

enum class HttpMethod { Get, Post, Put, Patch, Delete };

[[nodiscard]] std::string_view to_string(HttpMethod method) noexcept;

// Exact, upper-case match only ("get" is rejected).
[[nodiscard]] std::optional<HttpMethod> parse_http_method(std::string_view text) noexcept;

// POST, PUT and PATCH are the only methods that carry a request body.
[[nodiscard]] constexpr bool method_allows_body(HttpMethod method) noexcept {
    return method == HttpMethod::Post || method == HttpMethod::Put ||
           method == HttpMethod::Patch;
}

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    HeaderList headers;
    std::optional<std::string> body;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};

    void add_header(std::string name, std::string value) {
        headers.emplace_back(std::move(name), std::move(value));
    }
};

struct HttpResponse {
    long status_code = 0;
    // Header names are stored lower-cased; values keep arrival order.
    std::map<std::string, std::vector<std::string>> headers;
    std::string body;

    [[nodiscard]] bool is_success() const noexcept {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] const std::string& body_as_string() const noexcept { return body; }

    [[nodiscard]] std::expected<nlohmann::json, std::string> body_as_json() const;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

}  // namespace authprobe
