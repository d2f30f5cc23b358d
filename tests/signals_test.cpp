// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <thread>
#include <csignal>
#include <unistd.h>

#include <gtest/gtest.h>
#include <sundiald/signals.hpp>
#include <sundiald/wakeup.hpp>

using namespace sundiald;
using namespace std::chrono;

namespace {
bool wait_for_stop(const std::stop_source &ssource, milliseconds timeout) {
    const auto deadline = steady_clock::now() + timeout;
    while (!ssource.stop_requested() && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    return ssource.stop_requested();
}
}

// Process-directed signals, like the ones a service manager sends. Every
// thread of the test binary has them blocked while a shutdown_signal exists.
TEST(shutdown_signal, sigterm_requests_stop) {
    std::stop_source ssource;
    shutdown_signal signals(ssource);
    signals.start();

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    EXPECT_TRUE(wait_for_stop(ssource, seconds(2)));
}

TEST(shutdown_signal, repeated_signals_coalesce) {
    std::stop_source ssource;
    shutdown_signal signals(ssource);
    signals.start();

    ASSERT_EQ(kill(getpid(), SIGINT), 0);
    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    ASSERT_EQ(kill(getpid(), SIGINT), 0);

    EXPECT_TRUE(wait_for_stop(ssource, seconds(2)));
    EXPECT_TRUE(ssource.stop_requested());
}

TEST(shutdown_signal, interrupts_a_long_wait) {
    std::stop_source ssource;
    shutdown_signal signals(ssource);
    signals.start();
    wakeup w;

    std::jthread sender([] {
        std::this_thread::sleep_for(milliseconds(200));
        kill(getpid(), SIGTERM);
    });

    const auto start = steady_clock::now();
    EXPECT_EQ(w.wait_for(hours(8), ssource.get_token()), wakeup::reason::STOPPED);
    EXPECT_LT(steady_clock::now() - start, milliseconds(1500));
}

TEST(shutdown_signal, signal_before_start_is_held) {
    std::stop_source ssource;
    shutdown_signal signals(ssource);

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_FALSE(ssource.stop_requested());

    signals.start();
    EXPECT_TRUE(wait_for_stop(ssource, seconds(2)));
}

TEST(shutdown_signal, never_started) {
    std::stop_source ssource;
    {
        shutdown_signal signals(ssource);
        ASSERT_EQ(kill(getpid(), SIGINT), 0);
    }
    // still alive: the pending signal was consumed, not delivered
    EXPECT_FALSE(ssource.stop_requested());
}

TEST(shutdown_signal, start_twice) {
    std::stop_source ssource;
    shutdown_signal signals(ssource);
    signals.start();
    signals.start();

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    EXPECT_TRUE(wait_for_stop(ssource, seconds(2)));
}

TEST(shutdown_signal, no_signal_no_stop) {
    std::stop_source ssource;
    {
        shutdown_signal signals(ssource);
        signals.start();
        std::this_thread::sleep_for(milliseconds(300));
    }
    EXPECT_FALSE(ssource.stop_requested());
}
