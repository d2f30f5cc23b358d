// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PHASE_HPP
#define PHASE_HPP

#include <string>
#include <chrono>
#include <sundiald/time.hpp>

namespace sundiald {

enum class phase {
    BEFORE_DAYTIME,
    DAYTIME,
    AFTER_DAYTIME,
};

std::string phase_name(phase p);

phase classify(time_of_day now, time_of_day sunrise, time_of_day sunset);

// Never negative. After sunset the next boundary is end_of_day,
// so that tomorrow's sunrise is computed for tomorrow's date.
std::chrono::seconds duration_to_next_boundary(time_of_day now, time_of_day sunrise, time_of_day sunset);

struct filter_command {
    enum class kind {
        ENABLE,
        DISABLE,
    } kind;
    int temperature;

    bool operator==(const filter_command &) const = default;
};

filter_command command_for(phase p, int temperature);
std::string to_string(const filter_command &cmd);

}

#endif // PHASE_HPP
