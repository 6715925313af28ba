/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>

#include "include/config.hpp"
#include "include/http_types.hpp"

typedef void CURL;

namespace authprobe {

// Sends a single request and hands back the fully buffered response.
// Implementations honour request.timeout as a hard upper bound and abort
// promptly once stop is requested.
class HttpTransport {
   public:
    virtual ~HttpTransport() = default;

    virtual std::expected<HttpResponse, std::string> execute(const HttpRequest& request,
                                                             std::stop_token stop) = 0;

   protected:
    HttpTransport() = default;
    HttpTransport(const HttpTransport&) = default;
    HttpTransport& operator=(const HttpTransport&) = default;
};

// libcurl transport. One easy handle is reused across calls, so an instance
// must not be driven from two threads at once.
class HttpClient final : public HttpTransport {
   public:
    explicit HttpClient(std::size_t max_body_bytes = Config::MAX_RESPONSE_BYTES);
    ~HttpClient() override = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpResponse, std::string> execute(const HttpRequest& request,
                                                     std::stop_token stop) override;

   private:
    std::unique_ptr<CURL, void (*)(CURL*)> handle_;
    std::size_t max_body_bytes_;

    static size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) noexcept;
    static size_t write_header(char* ptr, size_t size, size_t nmemb, void* userdata) noexcept;
};

}  // namespace authprobe
