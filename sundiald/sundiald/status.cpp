// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <ctime>
#include <chrono>

#include <nlohmann/json.hpp>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <sundiald/status.hpp>
#include <sundiald/phase.hpp>
#include <sundiald/time.hpp>
#include <sundiald/file.hpp>

namespace sundiald {

nlohmann::json status_to_json(status_data data, std::time_t updated) {
    return {
        {"phase", phase_name(phase(data.phase))},
        {"sunrise", time_of_day_fmt(time_of_day(data.sunrise))},
        {"sunset", time_of_day_fmt(time_of_day(data.sunset))},
        {"next_wake", data.next_wake},
        {"updated", updated},
    };
}

status_observer::status_observer(channel<status_data> &ch, std::filesystem::path filepath)
    : ch_(ch),
      filepath_(filepath),
      thr_([this] { run(); }) {
}

status_observer::~status_observer() {
    ch_.send(status_stopped);
    thr_.join();

    std::error_code ec;
    std::filesystem::remove(filepath_, ec);
}

void status_observer::run() {
    status_data prev = status_idle;

    while (true) {
        const status_data data = ch_.recv(prev);

        if (data.phase == status_stopped.phase) {
            spdlog::debug("[status] exit");
            return;
        }

        try {
            file_write(filepath_, status_to_json(data, std::time(nullptr)).dump(4));
        } catch (const std::exception &e) {
            spdlog::error("[status] failed to write {}: {}", filepath_, e.what());
        }

        prev = data;
    }
}

std::optional<nlohmann::json> status_read(std::filesystem::path filepath) {
    try {
        return nlohmann::json::parse(file_read(filepath));
    } catch (const std::ios_base::failure &e) {
        return std::nullopt;
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("[status] {} is corrupted: {}", filepath, e.what());
        return std::nullopt;
    }
}

}
