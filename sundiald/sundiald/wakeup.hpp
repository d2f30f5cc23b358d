// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef WAKEUP_HPP
#define WAKEUP_HPP

#include <chrono>
#include <mutex>
#include <condition_variable>
#include <stop_token>

namespace sundiald {

// Sleeps until ms have elapsed on the wall clock or a stop is requested.
void jthread_wait_until(std::chrono::milliseconds ms, std::stop_token stoken);

// Cancellable sleep that another thread can cut short without stopping it.
class wakeup {
    std::mutex mutex_;
    std::condition_variable_any cv_;
    bool pending_ = false;
public:
    enum class reason {
        TIMEOUT,
        WOKEN,
        STOPPED,
    };

    reason wait_for(std::chrono::milliseconds ms, std::stop_token stoken);

    // A notify() with nobody waiting is kept for the next wait_for().
    void notify();
};

}

#endif // WAKEUP_HPP
