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
#include <stop_token>
#include <string>
#include <string_view>

#include "include/config.hpp"
#include "include/endpoint_config.hpp"
#include "include/http_client.hpp"

namespace authprobe {

// Produces a bearer token for a client-credentials grant. Implementations
// never report success with an empty token.
class TokenAcquirer {
   public:
    virtual ~TokenAcquirer() = default;

    virtual std::expected<std::string, std::string> acquire(const ClientCredentials& credentials,
                                                            std::chrono::milliseconds timeout,
                                                            std::stop_token stop) = 0;
};

/**
 * Microsoft Entra ID (v2.0 endpoint) client-credentials flow.
 *
 * POSTs a form-encoded grant to <authority>/<tenant>/oauth2/v2.0/token and
 * returns the access_token of the JSON reply. A tenant given as an absolute
 * http(s) URL is used as the authority itself, which covers sovereign clouds
 * and local test servers. Nothing is cached between calls.
 */
class EntraTokenProvider final : public TokenAcquirer {
    HttpTransport& http_;
    std::string authority_host_;

   public:
    explicit EntraTokenProvider(HttpTransport& http,
                                std::string authority_host = std::string(Config::AUTHORITY_HOST));

    std::expected<std::string, std::string> acquire(const ClientCredentials& credentials,
                                                    std::chrono::milliseconds timeout,
                                                    std::stop_token stop) override;

    [[nodiscard]] std::string token_endpoint(std::string_view tenant) const;
};

[[nodiscard]] std::string url_encode(std::string_view text);

[[nodiscard]] std::string build_token_request_body(const ClientCredentials& credentials);

// Maps a token endpoint reply onto the token or a readable failure.
[[nodiscard]] std::expected<std::string, std::string> parse_token_response(const HttpResponse& response);

}  // namespace authprobe
