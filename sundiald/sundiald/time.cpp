// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <ctime>
#include <stdexcept>
#include <regex>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <sundiald/time.hpp>

namespace sundiald {

time_of_day to_time_of_day(std::time_t ts) {
    using namespace std::chrono;
    const auto tp = system_clock::from_time_t(ts);
    return duration_cast<seconds>(tp - floor<days>(tp));
}

std::chrono::year_month_day to_date(std::time_t ts) {
    using namespace std::chrono;
    return year_month_day(floor<days>(system_clock::from_time_t(ts)));
}

std::time_t same_day_at(std::time_t ts, time_of_day tod) {
    return ts - to_time_of_day(ts).count() + tod.count();
}

time_of_day parse_time_of_day(const std::string &str) {
    static const std::regex pattern("^(\\d{2}):(\\d{2})(?::(\\d{2}))?$");

    std::smatch m;
    if (!std::regex_match(str, m, pattern)) {
        throw std::invalid_argument(fmt::format("invalid time of day: \"{}\"", str));
    }

    const int h = std::stoi(m[1].str());
    const int min = std::stoi(m[2].str());
    const int s = m[3].matched ? std::stoi(m[3].str()) : 0;

    if (h > 23 || min > 59 || s > 59) {
        throw std::invalid_argument(fmt::format("invalid time of day: \"{}\"", str));
    }

    return time_of_day(h * 3600 + min * 60 + s);
}

std::string time_of_day_fmt(time_of_day tod) {
    return fmt::format("{:%H:%M:%S}", tod);
}

std::string timestamp_fmt(std::time_t ts) {
    std::tm tm {};
    gmtime_r(&ts, &tm);
    return fmt::format("{:%Y-%m-%d %H:%M:%S} UTC", tm);
}

// 5h 02m 07s
std::string duration_fmt(std::chrono::seconds s) {
    using namespace std::chrono;
    const auto h = duration_cast<hours>(s);
    const auto m = duration_cast<minutes>(s - h);
    return fmt::format("{}h {:02}m {:02}s", h.count(), m.count(), (s - h - m).count());
}

} // namespace sundiald
