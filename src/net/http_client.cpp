/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/http_client.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <span>
#include <stdexcept>
#include <string_view>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "include/config.hpp"
#include "include/interrupts.hpp"
#include "include/utils.hpp"

namespace authprobe {

namespace {

struct CurlSlistDeleter {
    void operator()(struct curl_slist* list) const noexcept {
        if (list) curl_slist_free_all(list);
    }
};

class CurlHeaders {
    std::unique_ptr<struct curl_slist, CurlSlistDeleter> list_;

   public:
    void add(const std::string& header) {
        auto new_head = curl_slist_append(list_.get(), header.c_str());
        if (!new_head) {
            throw std::runtime_error("Failed to allocate curl header list");
        }
        if (!list_) {
            list_.reset(new_head);
        }
    }

    struct curl_slist* get() const { return list_.get(); }
};

struct TransferState {
    HttpResponse* response = nullptr;
    std::size_t limit = 0;
    bool overflow = false;
};

int abort_on_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

bool has_header(const HeaderList& headers, std::string_view name) {
    return std::ranges::any_of(headers, [name](const auto& h) {
        return to_lower(h.first) == to_lower(name);
    });
}

std::string describe_failure(CURLcode code, const char* detail, const HttpRequest& request,
                             const TransferState& state) {
    std::string_view reason = (detail && *detail) ? std::string_view(detail)
                                                  : std::string_view(curl_easy_strerror(code));
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return std::format("deadline exceeded after {}ms: {}", request.timeout.count(), reason);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return std::format("malformed URL '{}': {}", request.url, reason);
        case CURLE_WRITE_ERROR:
            if (state.overflow) {
                return std::format("response body exceeds {} bytes", state.limit);
            }
            return std::format("network error: {}", reason);
        default:
            return std::format("network error: {}", reason);
    }
}

}  // namespace

HttpClient::HttpClient(std::size_t max_body_bytes)
    : handle_(curl_easy_init(), curl_easy_cleanup), max_body_bytes_(max_body_bytes) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

size_t HttpClient::write_body(char* ptr, size_t size, size_t nmemb, void* userdata) noexcept {
    try {
        auto* state = static_cast<TransferState*>(userdata);
        size_t total_size = size * nmemb;
        if (state->response->body.size() + total_size > state->limit) {
            state->overflow = true;
            return 0;
        }

        std::span<const char> data_view(ptr, total_size);
        state->response->body.append(data_view.begin(), data_view.end());
        return total_size;
    } catch (...) {
        return 0;
    }
}

size_t HttpClient::write_header(char* ptr, size_t size, size_t nmemb, void* userdata) noexcept {
    try {
        auto* state = static_cast<TransferState*>(userdata);
        size_t total_size = size * nmemb;
        std::string_view line = trim_sv(std::string_view(ptr, total_size));

        // Every hop of a redirect chain starts with its own status line.
        if (line.starts_with("HTTP/")) {
            state->response->headers.clear();
            return total_size;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return total_size;
        }

        std::string name = to_lower(trim_sv(line.substr(0, colon)));
        std::string value(trim_sv(line.substr(colon + 1)));
        state->response->headers[name].push_back(std::move(value));
        return total_size;
    } catch (...) {
        return 0;
    }
}

std::expected<HttpResponse, std::string> HttpClient::execute(const HttpRequest& request,
                                                             std::stop_token stop) {
    if (request.timeout.count() <= 0) {
        return std::unexpected(std::format("invalid timeout: {}ms", request.timeout.count()));
    }

    CURL* handle = handle_.get();
    curl_easy_reset(handle);

    HttpResponse response;
    TransferState state{&response, max_body_bytes_, false};
    std::array<char, CURL_ERROR_SIZE> error_buffer{};
    const std::string method_name(to_string(request.method));
    static const std::string empty_payload;

    CurlHeaders headers;
    for (const auto& [name, value] : request.headers) {
        headers.add(std::format("{}: {}", name, value));
    }

    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Delete:
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method_name.c_str());
            break;
        case HttpMethod::Post:
        case HttpMethod::Put:
        case HttpMethod::Patch: {
            const std::string& payload = request.body ? *request.body : empty_payload;
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(payload.size()));
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, payload.data());
            // Plain POST lets a 301/302/303 redirect continue as GET.
            if (request.method != HttpMethod::Post) {
                curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method_name.c_str());
            }
            // Suppress curl's implicit form content type on bodiless writes.
            if (!has_header(request.headers, "Content-Type")) {
                headers.add("Content-Type:");
            }
            break;
        }
    }

    const long timeout_ms = static_cast<long>(request.timeout.count());
    const long connect_ms = std::min(timeout_ms, Config::HTTP_CONNECT_TIMEOUT_SEC * 1000L);

    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_USERAGENT, Config::USER_AGENT.data());
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer.data());

    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, connect_ms);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, Config::HTTP_MAX_REDIRECTS);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, abort_on_stop);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);

    spdlog::debug("HTTP {} {} (timeout {}ms)", method_name, request.url, timeout_ms);

    CURLcode res = curl_easy_perform(handle);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, nullptr);
    check_interrupted(stop);

    if (res != CURLE_OK) {
        auto message = describe_failure(res, error_buffer.data(), request, state);
        spdlog::debug("HTTP {} {} failed: {}", method_name, request.url, message);
        return std::unexpected(std::move(message));
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_code);
    spdlog::debug("HTTP {} {} -> {} ({} bytes)",
                  method_name, request.url, response.status_code, response.body.size());
    return response;
}

}  // namespace authprobe
