// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef TIME_HPP
#define TIME_HPP

#include <chrono>
#include <ctime>
#include <string>

namespace sundiald {

// All times are UTC. A time of day is the number of seconds since midnight.
using time_of_day = std::chrono::seconds;

inline constexpr time_of_day end_of_day {23 * 3600 + 59 * 60 + 59};

time_of_day to_time_of_day(std::time_t ts);
std::chrono::year_month_day to_date(std::time_t ts);

// ts moved to tod on the same UTC day
std::time_t same_day_at(std::time_t ts, time_of_day tod);

// "HH:MM:SS", accepts "HH:MM" too. Throws std::invalid_argument.
time_of_day parse_time_of_day(const std::string &str);

std::string time_of_day_fmt(time_of_day tod);
std::string timestamp_fmt(std::time_t ts);
std::string duration_fmt(std::chrono::seconds s);

}
#endif // TIME_HPP
