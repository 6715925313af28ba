/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <csignal>
#include <stdexcept>
#include <stop_token>
#include <thread>

class InterruptedError : public std::runtime_error {
   public:
    InterruptedError() : std::runtime_error("Operation interrupted by user") {}
};

// Throws InterruptedError once stop has been requested.
void check_interrupted(const std::stop_token& stop);

// Blocks SIGINT/SIGTERM for the process and converts them into a stop
// request on token(). Construct before any other thread is started so the
// mask is inherited.
class SignalGuard {
    std::stop_source source_;
    sigset_t previous_mask_{};
    std::jthread watcher_;

   public:
    SignalGuard();
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

    [[nodiscard]] std::stop_token token() const noexcept { return source_.get_token(); }
};
