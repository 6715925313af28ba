/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/endpoint_config.hpp"

#include <cerrno>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "include/utils.hpp"

using json = nlohmann::json;

namespace authprobe {

namespace {

const json* find_field(const json& node, std::string_view key) {
    if (auto it = node.find(std::string(key)); it != node.end()) {
        return &*it;
    }

    const std::string wanted = to_lower(key);
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (to_lower(it.key()) == wanted) {
            return &it.value();
        }
    }
    return nullptr;
}

std::expected<std::string, std::string> read_string(const json& node, std::string_view key) {
    const json* field = find_field(node, key);
    if (!field || field->is_null()) {
        return std::string{};
    }
    if (!field->is_string()) {
        return std::unexpected(std::format("{} must be a string", key));
    }
    return field->get<std::string>();
}

}  // namespace

std::expected<void, std::string> validate_endpoint(const EndpointDefinition& endpoint) {
    if (endpoint.name.empty()) return std::unexpected("name is required");
    if (endpoint.url.empty()) return std::unexpected("url is required");
    if (endpoint.credentials.client_id.empty()) return std::unexpected("clientId is required");
    if (endpoint.credentials.client_secret.empty()) return std::unexpected("clientSecret is required");
    if (endpoint.credentials.tenant_id.empty()) return std::unexpected("tenantId is required");
    if (endpoint.credentials.scope.empty()) return std::unexpected("scope is required");
    if (endpoint.request_body && !endpoint.request_body->is_object()) {
        return std::unexpected("requestBody must be a JSON object");
    }
    return {};
}

std::expected<EndpointDefinition, std::string> parse_endpoint(const json& node) {
    if (!node.is_object()) {
        return std::unexpected("endpoint must be a JSON object");
    }

    EndpointDefinition endpoint;
    std::string method_text;

    struct Field {
        std::string_view key;
        std::string* target;
    };
    const Field fields[] = {
        {"name", &endpoint.name},
        {"url", &endpoint.url},
        {"method", &method_text},
        {"clientId", &endpoint.credentials.client_id},
        {"clientSecret", &endpoint.credentials.client_secret},
        {"tenantId", &endpoint.credentials.tenant_id},
        {"scope", &endpoint.credentials.scope},
    };

    for (const auto& field : fields) {
        auto value = read_string(node, field.key);
        if (!value) return std::unexpected(value.error());
        *field.target = std::move(*value);
    }

    if (const json* body = find_field(node, "requestBody"); body && !body->is_null()) {
        endpoint.request_body = *body;
    }

    if (endpoint.name.empty()) return std::unexpected("name is required");
    if (endpoint.url.empty()) return std::unexpected("url is required");
    if (method_text.empty()) return std::unexpected("method is required");

    auto method = parse_http_method(method_text);
    if (!method) {
        return std::unexpected(std::format(
            "invalid HTTP method: {} (must be GET, POST, PUT, PATCH, or DELETE)", method_text));
    }
    endpoint.method = *method;

    if (auto valid = validate_endpoint(endpoint); !valid) {
        return std::unexpected(valid.error());
    }
    return endpoint;
}

std::expected<std::vector<EndpointDefinition>, std::string> parse_config(std::string_view document) {
    json root;
    try {
        root = json::parse(document);
    } catch (const json::parse_error& e) {
        return std::unexpected(std::format("failed to decode config file: {}", e.what()));
    }

    if (!root.is_object()) {
        return std::unexpected("failed to decode config file: top-level value must be a JSON object");
    }

    const json* list = find_field(root, "endpoints");
    if (list && !list->is_null() && !list->is_array()) {
        return std::unexpected("failed to decode config file: endpoints must be an array");
    }
    if (!list || list->is_null() || list->empty()) {
        return std::unexpected("invalid configuration: no endpoints defined in configuration");
    }

    std::vector<EndpointDefinition> endpoints;
    endpoints.reserve(list->size());

    for (std::size_t i = 0; i < list->size(); ++i) {
        const json& node = (*list)[i];
        auto endpoint = parse_endpoint(node);
        if (!endpoint) {
            std::string label;
            if (node.is_object()) {
                label = read_string(node, "name").value_or("");
            }
            return std::unexpected(
                std::format("invalid configuration: endpoint {} ({}): {}", i, label, endpoint.error()));
        }
        endpoints.push_back(std::move(*endpoint));
    }

    return endpoints;
}

std::expected<std::vector<EndpointDefinition>, std::string> load_config(
    const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("failed to open config file: {}: {}",
                                           path.string(),
                                           std::generic_category().message(errno)));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(std::format("failed to read config file: {}", path.string()));
    }

    auto endpoints = parse_config(buffer.str());
    if (endpoints) {
        spdlog::info("Loaded {} endpoint(s) from {}", endpoints->size(), path.string());
    }
    return endpoints;
}

}  // namespace authprobe
