// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef STATUS_HPP
#define STATUS_HPP

#include <filesystem>
#include <optional>
#include <thread>
#include <nlohmann/json_fwd.hpp>

#include <sundiald/channel.hpp>

namespace sundiald {

struct status_data {
    long phase;     // sundiald::phase, -1 when stopped
    long sunrise;   // seconds since UTC midnight
    long sunset;
    long next_wake; // unix timestamp
};

// initial value of the channel, before the first cycle
inline constexpr status_data status_idle {-2, -2, -2, -2};
inline constexpr status_data status_stopped {-1, -1, -1, -1};

// Expects ch to start out as status_idle.
// Writes every status change to a json file until destroyed.
// The file is removed on exit.
class status_observer {
    channel<status_data> &ch_;
    std::filesystem::path filepath_;
    std::jthread thr_;

    void run();
public:
    status_observer(channel<status_data> &ch, std::filesystem::path filepath);
    status_observer(const status_observer &) = delete;
    status_observer &operator=(const status_observer &) = delete;
    ~status_observer();
};

nlohmann::json status_to_json(status_data data, std::time_t updated);

std::optional<nlohmann::json> status_read(std::filesystem::path filepath);

}

#endif // STATUS_HPP
