/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "include/http_types.hpp"

namespace authprobe {

struct ClientCredentials {
    std::string client_id;
    std::string client_secret;
    std::string tenant_id;
    std::string scope;
};

struct EndpointDefinition {
    std::string name;
    std::string url;
    HttpMethod method = HttpMethod::Get;
    ClientCredentials credentials;
    // Always a JSON object when present.
    std::optional<nlohmann::json> request_body;
};

// Checks the non-empty constraints of an already-typed definition.
[[nodiscard]] std::expected<void, std::string> validate_endpoint(const EndpointDefinition& endpoint);

// Parses one entry of the "endpoints" array. Field names match case-insensitively.
[[nodiscard]] std::expected<EndpointDefinition, std::string> parse_endpoint(const nlohmann::json& node);

// Parses and validates a whole document. At least one endpoint is required.
[[nodiscard]] std::expected<std::vector<EndpointDefinition>, std::string> parse_config(
    std::string_view document);

[[nodiscard]] std::expected<std::vector<EndpointDefinition>, std::string> load_config(
    const std::filesystem::path& path);

}  // namespace authprobe
