// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include <sundiald/wakeup.hpp>

using namespace sundiald;
using namespace std::chrono;

TEST(wakeup, times_out) {
    wakeup w;
    std::stop_source ssource;
    const auto start = steady_clock::now();
    EXPECT_EQ(w.wait_for(milliseconds(100), ssource.get_token()), wakeup::reason::TIMEOUT);
    EXPECT_GE(steady_clock::now() - start, milliseconds(90));
}

TEST(wakeup, stop_interrupts_long_wait) {
    wakeup w;
    std::stop_source ssource;

    std::jthread stopper([&] {
        std::this_thread::sleep_for(milliseconds(200));
        ssource.request_stop();
    });

    const auto start = steady_clock::now();
    EXPECT_EQ(w.wait_for(hours(8), ssource.get_token()), wakeup::reason::STOPPED);
    EXPECT_LT(steady_clock::now() - start, seconds(1));
}

TEST(wakeup, already_stopped_returns_at_once) {
    wakeup w;
    std::stop_source ssource;
    ssource.request_stop();
    const auto start = steady_clock::now();
    EXPECT_EQ(w.wait_for(hours(1), ssource.get_token()), wakeup::reason::STOPPED);
    EXPECT_LT(steady_clock::now() - start, milliseconds(100));
}

TEST(wakeup, notify_cuts_wait_short) {
    wakeup w;
    std::stop_source ssource;

    std::jthread notifier([&] {
        std::this_thread::sleep_for(milliseconds(100));
        w.notify();
    });

    const auto start = steady_clock::now();
    EXPECT_EQ(w.wait_for(hours(1), ssource.get_token()), wakeup::reason::WOKEN);
    EXPECT_LT(steady_clock::now() - start, seconds(1));
    EXPECT_FALSE(ssource.stop_requested());
}

TEST(wakeup, notify_before_wait_is_kept_once) {
    wakeup w;
    std::stop_source ssource;
    w.notify();
    EXPECT_EQ(w.wait_for(hours(1), ssource.get_token()), wakeup::reason::WOKEN);
    EXPECT_EQ(w.wait_for(milliseconds(50), ssource.get_token()), wakeup::reason::TIMEOUT);
}

TEST(wakeup, jthread_wait_until_stops) {
    std::jthread thr([] (std::stop_token stoken) {
        jthread_wait_until(hours(1), stoken);
    });
    const auto start = steady_clock::now();
    thr.request_stop();
    thr.join();
    EXPECT_LT(steady_clock::now() - start, seconds(1));
}
