// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <spdlog/spdlog.h>

#include <sundiald/scheduler.hpp>
#include <sundiald/config.hpp>
#include <sundiald/time.hpp>

namespace sundiald {

scheduler::scheduler(const sundiald::location &loc,
                     int temperature,
                     std::chrono::seconds drift_delay,
                     filter_control &control,
                     channel<status_data> &status_ch,
                     clock_fn clock)
    : loc_(loc),
      temperature_(temperature),
      drift_delay_(drift_delay),
      control_(control),
      status_ch_(status_ch),
      clock_(clock),
      state_(state::STARTING) {

    // fail now rather than in the loop
    const auto today = sunrise_sunset(loc_, to_date(clock_()));
    spdlog::info("[scheduler] location: {}, {} ({}m), today: sunrise {}, sunset {} (UTC)",
                 loc_.latitude, loc_.longitude, loc_.altitude,
                 time_of_day_fmt(today.sunrise), time_of_day_fmt(today.sunset));
}

scheduler::scheduler(const config &conf,
                     filter_control &control,
                     channel<status_data> &status_ch)
    : scheduler(conf.location, conf.temperature, std::chrono::seconds(conf.drift_delay_s), control, status_ch) {
}

std::string scheduler::state_name(state s) {
    switch (s) {
    case state::STARTING:
        return "starting";
    case state::RUNNING:
        return "running";
    case state::CANCELLING:
        return "cancelling";
    case state::STOPPED:
        return "stopped";
    }
    return "error: unknown state";
}

scheduler::state scheduler::current_state() const {
    return state_.load();
}

void scheduler::set_state(state s) {
    spdlog::debug("[scheduler] {} -> {}", state_name(state_.load()), state_name(s));
    state_.store(s);
}

void scheduler::wake() {
    wakeup_.notify();
}

scheduler::cycle_result scheduler::cycle(std::time_t now) {
    const time_of_day tod        = to_time_of_day(now);
    const day_boundaries bounds  = sunrise_sunset(loc_, to_date(now));
    const day_boundaries segment = daylight_segment(bounds, tod);
    const sundiald::phase p      = classify(tod, segment.sunrise, segment.sunset);
    const filter_command cmd     = command_for(p, temperature_);

    spdlog::info("[scheduler] now: {}, sunrise: {}, sunset: {}, phase: {}",
                 time_of_day_fmt(tod), time_of_day_fmt(bounds.sunrise), time_of_day_fmt(bounds.sunset), phase_name(p));

    const bool applied = [&] {
        try {
            control_.apply(cmd);
            spdlog::info("[scheduler] blue light filter: {}", to_string(cmd));
            return true;
        } catch (const std::exception &e) {
            spdlog::error("[scheduler] failed to {} blue light filter via {}: {}", to_string(cmd), control_.name(), e.what());
            return false;
        }
    }();

    const std::chrono::seconds sleep = duration_to_next_boundary(tod, segment.sunrise, segment.sunset);

    status_ch_.send({
        long(p),
        long(bounds.sunrise.count()),
        long(bounds.sunset.count()),
        long(now + sleep.count()),
    });

    return { bounds, p, cmd, applied, sleep };
}

void scheduler::run(std::stop_token stoken) {
    set_state(state::RUNNING);

    while (!stoken.stop_requested()) {
        const cycle_result res = cycle(clock_());

        spdlog::info("[scheduler] sleeping for {} (~{})",
                     duration_fmt(res.sleep), std::chrono::duration_cast<std::chrono::hours>(res.sleep));

        const wakeup::reason reason = wakeup_.wait_for(res.sleep, stoken);

        if (reason == wakeup::reason::STOPPED)
            break;

        if (reason == wakeup::reason::WOKEN) {
            spdlog::info("[scheduler] woken up early, re-evaluating");
            continue;
        }

        // Boundary reached. Give the clock some slack so we don't
        // land a few seconds short of it and flap.
        if (drift_delay_.count() > 0
        && wakeup_.wait_for(drift_delay_, stoken) == wakeup::reason::STOPPED) {
            break;
        }
    }

    set_state(state::CANCELLING);
    spdlog::info("[scheduler] stop requested, no further commands");
    set_state(state::STOPPED);
}

}
