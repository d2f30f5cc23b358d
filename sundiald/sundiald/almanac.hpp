// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef ALMANAC_HPP
#define ALMANAC_HPP

#include <chrono>
#include <sundiald/time.hpp>

namespace sundiald {

struct location {
    double latitude;  // degrees, [-90, 90]
    double longitude; // degrees, [-180, 180]
    double altitude;  // meters above the horizon reference
};

struct day_boundaries {
    time_of_day sunrise;
    time_of_day sunset;
};

// Throws std::invalid_argument on coordinates out of range.
void validate(const location &loc);

// Sunrise and sunset for date at loc, as UTC times of day.
// Pure: the same input always yields the same output.
// When the sun never rises, both collapse to solar noon;
// when it never sets, they span the whole day.
// Far from Greenwich daylight can straddle UTC midnight, in which case
// sunrise > sunset (see crosses_midnight).
day_boundaries sunrise_sunset(const location &loc, std::chrono::year_month_day date);

bool crosses_midnight(const day_boundaries &day);

// The [sunrise, sunset) pair, sunrise <= sunset, that now has to be classified
// against. Unchanged unless day crosses midnight; then it is either
// [00:00:00, sunset) or [sunrise, 24:00:00), whichever now is not past.
day_boundaries daylight_segment(const day_boundaries &day, time_of_day now);

namespace almanac {
double julian_day(std::time_t ts);
std::time_t unix_time(double julian_day);
}

}

#endif // ALMANAC_HPP
