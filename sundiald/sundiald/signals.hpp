// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SIGNALS_HPP
#define SIGNALS_HPP

#include <thread>
#include <stop_token>
#include <signal.h>

namespace sundiald {

// Turns SIGINT and SIGTERM into stop requests on ssource.
//
// Must be constructed before any other thread is started: the signals are
// blocked in the calling thread, and threads created afterwards inherit
// the mask, so only the watcher thread ever sees them. Signals arriving
// before start() stay pending and are handled once it runs.
class shutdown_signal {
    sigset_t set_;
    sigset_t old_set_;
    std::stop_source ssource_;
    std::jthread thr_;

    void watch(std::stop_token stoken);
public:
    shutdown_signal(std::stop_source ssource);
    shutdown_signal(const shutdown_signal &) = delete;
    shutdown_signal &operator=(const shutdown_signal &) = delete;
    ~shutdown_signal();

    // Starts the watcher thread. Call it once logging is set up.
    void start();
};

void unblock_shutdown_signals();

}

#endif // SIGNALS_HPP
