// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <system_error>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <pthread.h>

#include <spdlog/spdlog.h>
#include <sundiald/signals.hpp>

namespace {
sigset_t shutdown_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}
}

namespace sundiald {

shutdown_signal::shutdown_signal(std::stop_source ssource)
    : set_(shutdown_set()),
      ssource_(ssource) {

    // pthread_sigmask returns the error instead of setting errno
    if (const int err = pthread_sigmask(SIG_BLOCK, &set_, &old_set_); err != 0) {
        throw std::system_error(err, std::generic_category(), "[signals] pthread_sigmask");
    }
}

void shutdown_signal::start() {
    if (thr_.joinable())
        return;

    thr_ = std::jthread([this] (std::stop_token stoken) {
        watch(stoken);
    });
}

shutdown_signal::~shutdown_signal() {
    if (thr_.joinable()) {
        thr_.request_stop();
        thr_.join();
    }

    // consume what arrived after the watcher stopped, or unblocking would deliver it
    const timespec zero {0, 0};
    while (sigtimedwait(&set_, nullptr, &zero) > 0) {}

    pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
}

void shutdown_signal::watch(std::stop_token stoken) {
    spdlog::debug("[signals] watching SIGINT, SIGTERM");

    // sigtimedwait so that the destructor can end the thread
    const timespec timeout {0, 200'000'000};

    while (!stoken.stop_requested()) {
        const int sig = sigtimedwait(&set_, nullptr, &timeout);

        if (sig < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            spdlog::error("[signals] sigtimedwait: {}, shutting down", std::strerror(errno));
            ssource_.request_stop();
            return;
        }

        spdlog::info("[signals] received {}, shutting down", strsignal(sig));
        ssource_.request_stop();
    }
}

void unblock_shutdown_signals() {
    const sigset_t set = shutdown_set();
    pthread_sigmask(SIG_UNBLOCK, &set, nullptr);
}

}
