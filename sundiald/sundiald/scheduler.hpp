// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <stop_token>

#include <sundiald/almanac.hpp>
#include <sundiald/phase.hpp>
#include <sundiald/control.hpp>
#include <sundiald/channel.hpp>
#include <sundiald/status.hpp>
#include <sundiald/wakeup.hpp>

namespace sundiald {

class config;

class scheduler {
public:
    enum class state {
        STARTING,
        RUNNING,
        CANCELLING,
        STOPPED,
    };

    using clock_fn = std::function<std::time_t()>;

    struct cycle_result {
        day_boundaries boundaries; // as the almanac reports them, may cross midnight
        sundiald::phase phase;
        filter_command command;
        bool applied;
        std::chrono::seconds sleep;
    };

    // Validates the location against the almanac; throws std::invalid_argument.
    scheduler(const sundiald::location &loc,
              int temperature,
              std::chrono::seconds drift_delay,
              filter_control &control,
              channel<status_data> &status_ch,
              clock_fn clock = [] { return std::time(nullptr); });

    scheduler(const config &conf,
              filter_control &control,
              channel<status_data> &status_ch);

    // Loops until stoken is stopped.
    void run(std::stop_token stoken);

    // One pass: boundaries, phase, command, status. Never throws on control errors.
    cycle_result cycle(std::time_t now);

    // Cuts the current wait short and re-evaluates right away.
    void wake();

    state current_state() const;
    static std::string state_name(state s);

private:
    const sundiald::location loc_;
    const int temperature_;
    const std::chrono::seconds drift_delay_;
    filter_control &control_;
    channel<status_data> &status_ch_;
    clock_fn clock_;
    wakeup wakeup_;
    std::atomic<state> state_;

    void set_state(state s);
};

}

#endif // SCHEDULER_HPP
