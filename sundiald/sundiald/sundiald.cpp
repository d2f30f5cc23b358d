// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sdbus-c++/Error.h>
#include <CLI/App.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Config.hpp>

#include <sundiald/file.hpp>
#include <sundiald/config.hpp>
#include <sundiald/constants.hpp>
#include <sundiald/control.hpp>
#include <sundiald/scheduler.hpp>
#include <sundiald/signals.hpp>
#include <sundiald/status.hpp>
#include <sundiald/sd-dbus.hpp>
#include <sundiald/time.hpp>

using namespace sundiald;

void setup_logging() {
    const auto log_dir = xdg_state_dir() / "sundiald/logs";
    std::filesystem::create_directories(log_dir);

    const std::vector<spdlog::sink_ptr> sinks {
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_dir / "sundiald.log", 1048576 * 5, 3),
    };

    spdlog::set_default_logger(std::make_shared<spdlog::logger>("sundiald", sinks.begin(), sinks.end()));
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
    spdlog::flush_every(std::chrono::seconds(10));
    spdlog::flush_on(spdlog::level::err);
}

std::filesystem::path config_path(const std::string &opt) {
    if (!opt.empty())
        return opt;
    return xdg_config_dir() / constants::config_filename;
}

// The schedule for the configured location at now. Touches nothing.
int print_schedule(const config &conf, std::time_t now) {
    const time_of_day tod    = to_time_of_day(now);
    const day_boundaries b   = sunrise_sunset(conf.location, to_date(now));
    const day_boundaries seg = daylight_segment(b, tod);
    const phase p            = classify(tod, seg.sunrise, seg.sunset);
    const auto next          = duration_to_next_boundary(tod, seg.sunrise, seg.sunset);

    fmt::print("location: {}, {} ({}m)\n", conf.location.latitude, conf.location.longitude, conf.location.altitude);
    fmt::print("now:      {}\n", timestamp_fmt(now));
    fmt::print("sunrise:  {} UTC\n", time_of_day_fmt(b.sunrise));
    fmt::print("sunset:   {} UTC{}\n", time_of_day_fmt(b.sunset), crosses_midnight(b) ? " (daylight crosses UTC midnight)" : "");
    fmt::print("phase:    {}\n", phase_name(p));
    fmt::print("filter:   {}\n", to_string(command_for(p, conf.temperature)));
    fmt::print("next:     {} (in {})\n", timestamp_fmt(now + next.count()), duration_fmt(next));
    return EXIT_SUCCESS;
}

int print_status() {
    // reads the holder's pid, never takes the lock
    const std::optional<pid_t> pid = lockfile_owner(xdg_runtime_dir() / constants::flock_filename);

    if (!pid) {
        std::puts("not running");
        return EXIT_SUCCESS;
    }

    fmt::print("running (pid {})\n", *pid);

    const auto status = status_read(xdg_runtime_dir() / constants::status_filename);
    if (status) {
        fmt::print("phase:     {}\n", (*status)["phase"].get<std::string>());
        fmt::print("sunrise:   {} UTC\n", (*status)["sunrise"].get<std::string>());
        fmt::print("sunset:    {} UTC\n", (*status)["sunset"].get<std::string>());
        fmt::print("next wake: {}\n", timestamp_fmt((*status)["next_wake"].get<std::time_t>()));
    }

    return EXIT_SUCCESS;
}

int run_daemon(const std::filesystem::path &conf_path, std::stop_source ssource) {
    spdlog::info("sundiald v{}", VERSION);

    lockfile flock(xdg_runtime_dir() / constants::flock_filename);
    if (!flock.acquired()) {
        spdlog::warn("another instance is running, exiting");
        return EXIT_SUCCESS;
    }

    const config conf(conf_path);
    spdlog::info("[config] {}: {}", conf.path(), conf.to_json().dump());

    const std::unique_ptr<filter_control> control = make_control(conf, ssource.get_token());
    if (ssource.stop_requested()) {
        return EXIT_SUCCESS;
    }
    spdlog::info("[control] {}", control->name());

    channel<status_data> status_ch(status_idle);
    scheduler sched(conf, *control, status_ch);
    status_observer observer(status_ch, xdg_runtime_dir() / constants::status_filename);

    // the schedule is stale after a suspend
    const auto proxy = [&sched] {
        try {
            return dbus::on_system_sleep([&sched] (bool sleep) {
                if (!sleep) {
                    sched.wake();
                }
            });
        } catch (const sdbus::Error &e) {
            spdlog::error("[dbus] on_system_sleep error: {}.", e.what());
            return std::unique_ptr<sdbus::IProxy>();
        }
    }();

    sched.run(ssource.get_token());

    spdlog::info("exiting");
    return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    CLI::App app("Turns the blue light filter on at sunset and off at sunrise.", "sundiald");

    std::string conf_opt;
    std::string at_opt;
    bool status_flag = false;
    bool print_flag  = false;

    const CLI::Validator time_of_day_check([] (const std::string &s) {
        try {
            parse_time_of_day(s);
            return std::string();
        } catch (const std::invalid_argument &e) {
            return std::string(e.what());
        }
    }, "HH:MM[:SS]");

    app.set_version_flag("-v,--version", VERSION);
    app.add_option("-c,--config", conf_opt, "Configuration file. Default: $XDG_CONFIG_HOME/sundiald.json");
    app.add_flag("-s,--status", status_flag, "Print whether the daemon is running and its current schedule, then exit.");
    CLI::Option *print_opt = app.add_flag("-p,--print", print_flag, "Print today's sunrise, sunset and phase for the configured location, then exit.");
    app.add_option("--at", at_opt, "With --print: evaluate at this UTC time of today instead of now.")->check(time_of_day_check)->needs(print_opt);

    CLI11_PARSE(app, argc, argv);

    try {
        if (status_flag) {
            setup_logging();
            return print_status();
        }

        if (print_flag) {
            setup_logging();
            const std::time_t now = std::time(nullptr);
            return print_schedule(config(config_path(conf_opt)),
                                  at_opt.empty() ? now : same_day_at(now, parse_time_of_day(at_opt)));
        }

        // Mask first so that every thread, spdlog's flusher included, inherits it.
        // The watcher itself logs, so it waits for the logger.
        std::stop_source ssource;
        shutdown_signal signals(ssource);
        setup_logging();
        signals.start();

        return run_daemon(config_path(conf_opt), ssource);
    } catch (const std::exception &e) {
        spdlog::critical("{}", e.what());
        spdlog::shutdown();
        return EXIT_FAILURE;
    }
}
