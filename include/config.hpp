/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "authprobe";
    constexpr std::string_view APP_VERSION = "1.2.0";
    constexpr std::string_view DEFAULT_CONFIG_PATH = "config.json";
    constexpr std::string_view DEFAULT_LOG_LEVEL = "warn";

    constexpr std::string_view AUTHORITY_HOST = "https://login.microsoftonline.com";
    constexpr std::string_view TOKEN_PATH = "/oauth2/v2.0/token";
    constexpr std::string_view USER_AGENT = "authprobe/1.2.0";

    constexpr long AUTH_TIMEOUT_SEC = 30;
    constexpr long REQUEST_TIMEOUT_SEC = 30;
    constexpr long MAX_TIMEOUT_SEC = 24 * 60 * 60;
    constexpr long HTTP_CONNECT_TIMEOUT_SEC = 10;
    constexpr long HTTP_MAX_REDIRECTS = 10;
    constexpr std::size_t MAX_RESPONSE_BYTES = 16 * 1024 * 1024;

    constexpr std::size_t TERM_WIDTH = 80;
    constexpr int SUMMARY_LABEL_WIDTH = 26;
    constexpr int BREAKDOWN_LABEL_WIDTH = 28;
    constexpr std::size_t BODY_PREVIEW_LIMIT = 512;
}
