// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/interrupts.hpp"

#include <csignal>
#include <ctime>
#include <system_error>

#include <pthread.h>
#include <spdlog/spdlog.h>

namespace {

sigset_t shutdown_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

}  // namespace

void check_interrupted(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw InterruptedError();
    }
}

SignalGuard::SignalGuard() {
    sigset_t set = shutdown_signals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, &previous_mask_);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "Failed to block shutdown signals");
    }

    watcher_ = std::jthread([this, set](std::stop_token st) {
        const timespec poll_interval{0, 100'000'000};

        while (!st.stop_requested()) {
            int sig = sigtimedwait(&set, nullptr, &poll_interval);
            if (sig == SIGINT || sig == SIGTERM) {
                spdlog::warn("Received signal {}, aborting run", sig);
                source_.request_stop();
                return;
            }
        }
    });
}

SignalGuard::~SignalGuard() {
    watcher_ = std::jthread();

    // A signal that arrived after the watcher exited is still pending and
    // would fire with its default action once unblocked.
    sigset_t set = shutdown_signals();
    const timespec no_wait{0, 0};
    while (sigtimedwait(&set, nullptr, &no_wait) > 0) {
    }

    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}
