/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/http_types.hpp"

#include <format>

#include "include/utils.hpp"

namespace authprobe {

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Patch: return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

std::optional<HttpMethod> parse_http_method(std::string_view text) noexcept {
    if (text == "GET") return HttpMethod::Get;
    if (text == "POST") return HttpMethod::Post;
    if (text == "PUT") return HttpMethod::Put;
    if (text == "PATCH") return HttpMethod::Patch;
    if (text == "DELETE") return HttpMethod::Delete;
    return std::nullopt;
}

std::expected<nlohmann::json, std::string> HttpResponse::body_as_json() const {
    if (body.empty()) {
        return std::unexpected("empty response body");
    }

    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(std::format("invalid JSON in response body: {}", e.what()));
    }
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

}  // namespace authprobe
