// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cmath>
#include <numbers>
#include <stdexcept>

#include <fmt/core.h>
#include <sundiald/almanac.hpp>

// Sunrise equation, https://en.wikipedia.org/wiki/Sunrise_equation
namespace {

constexpr double unix_epoch_jd   = 2440587.5;
constexpr double j2000           = 2451545.0;
constexpr double seconds_per_day = 86400.;
constexpr double pi              = std::numbers::pi;

// refraction + solar disc radius
constexpr double sunrise_depression_deg = -0.833;

double deg2rad(double deg) {
    return deg * pi / 180.;
}

double solar_mean_anomaly(double day) {
    double v = std::fmod(357.5291 + 0.98560028 * (day - j2000), 360.);
    if (v < 0.)
        v += 360.;
    return deg2rad(v);
}

double equation_of_center(double m) {
    return deg2rad(1.9148 * std::sin(m) + 0.02 * std::sin(2. * m) + 0.0003 * std::sin(3. * m));
}

double argument_of_perihelion(double day) {
    return deg2rad(102.93005 + 0.3179526 * (day - j2000) / 36525.);
}

double ecliptic_longitude(double m, double c, double day) {
    return std::fmod(m + c + argument_of_perihelion(day) + pi, 2. * pi);
}

double solar_transit(double day, double m, double l) {
    return day + (0.0053 * std::sin(m) - 0.0069 * std::sin(2. * l));
}

double declination(double l) {
    return std::asin(std::sin(l) * 0.39779);
}

// Higher observers see the sun earlier and longer.
double altitude_correction_deg(double altitude) {
    return -2.076 * std::sqrt(altitude) / 60.;
}

// cosine of the hour angle, outside [-1, 1] when there is no event
double cos_hour_angle(double lat_deg, double decl, double altitude) {
    const double lat = deg2rad(lat_deg);
    const double angle = deg2rad(sunrise_depression_deg + altitude_correction_deg(altitude));
    return (std::sin(angle) - std::sin(lat) * std::sin(decl)) / (std::cos(lat) * std::cos(decl));
}

}

namespace sundiald {

double almanac::julian_day(std::time_t ts) {
    return double(ts) / seconds_per_day + unix_epoch_jd;
}

std::time_t almanac::unix_time(double julian_day) {
    return std::time_t((julian_day - unix_epoch_jd) * seconds_per_day);
}

void validate(const location &loc) {
    if (!std::isfinite(loc.latitude) || loc.latitude < -90. || loc.latitude > 90.) {
        throw std::invalid_argument(fmt::format("latitude out of range [-90, 90]: {}", loc.latitude));
    }
    if (!std::isfinite(loc.longitude) || loc.longitude < -180. || loc.longitude > 180.) {
        throw std::invalid_argument(fmt::format("longitude out of range [-180, 180]: {}", loc.longitude));
    }
    if (!std::isfinite(loc.altitude) || loc.altitude < 0.) {
        throw std::invalid_argument(fmt::format("altitude must be a non-negative number of meters: {}", loc.altitude));
    }
}

day_boundaries sunrise_sunset(const location &loc, std::chrono::year_month_day date) {
    using namespace std::chrono;

    validate(loc);

    if (!date.ok()) {
        throw std::invalid_argument("invalid calendar date");
    }

    const auto noon_utc = sys_days(date) + hours(12);
    const double day = almanac::julian_day(system_clock::to_time_t(noon_utc)) - loc.longitude / 360.;

    const double m       = solar_mean_anomaly(day);
    const double c       = equation_of_center(m);
    const double l       = ecliptic_longitude(m, c, day);
    const double transit = solar_transit(day, m, l);
    const double cos_h   = cos_hour_angle(loc.latitude, declination(l), loc.altitude);

    // polar night
    if (cos_h >= 1.) {
        const time_of_day noon = to_time_of_day(almanac::unix_time(transit));
        return { noon, noon };
    }

    // midnight sun
    if (cos_h <= -1.) {
        return { time_of_day(0), end_of_day };
    }

    const double frac = std::acos(cos_h) / (2. * pi);

    const time_of_day sunrise = to_time_of_day(almanac::unix_time(transit - frac));
    const time_of_day sunset  = to_time_of_day(almanac::unix_time(transit + frac));

    return { sunrise, sunset };
}

bool crosses_midnight(const day_boundaries &day) {
    return day.sunrise > day.sunset;
}

day_boundaries daylight_segment(const day_boundaries &day, time_of_day now) {
    if (!crosses_midnight(day)) {
        return day;
    }

    // morning part of the daylight that began the previous UTC day
    if (now < day.sunset) {
        return { time_of_day(0), day.sunset };
    }

    // up to midnight itself, so 23:59:59 is still daytime
    return { day.sunrise, std::chrono::days(1) };
}

}
