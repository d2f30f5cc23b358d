// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <fmt/core.h>
#include <sundiald/phase.hpp>

namespace sundiald {

std::string phase_name(phase p) {
    using enum phase;
    switch (p) {
    case BEFORE_DAYTIME:
        return "before daytime";
    case DAYTIME:
        return "daytime";
    case AFTER_DAYTIME:
        return "after daytime";
    }
    return "error: unknown phase";
}

phase classify(time_of_day now, time_of_day sunrise, time_of_day sunset) {
    if (now < sunrise)
        return phase::BEFORE_DAYTIME;
    if (now < sunset)
        return phase::DAYTIME;
    return phase::AFTER_DAYTIME;
}

std::chrono::seconds duration_to_next_boundary(time_of_day now, time_of_day sunrise, time_of_day sunset) {
    const std::chrono::seconds diff = [&] {
        using enum phase;
        switch (classify(now, sunrise, sunset)) {
        case BEFORE_DAYTIME:
            return sunrise - now;
        case DAYTIME:
            return sunset - now;
        case AFTER_DAYTIME:
            return end_of_day - now;
        }
        return std::chrono::seconds(0);
    }();

    return std::max(diff, std::chrono::seconds(0));
}

filter_command command_for(phase p, int temperature) {
    if (p == phase::DAYTIME)
        return { filter_command::kind::DISABLE, 0 };
    return { filter_command::kind::ENABLE, temperature };
}

std::string to_string(const filter_command &cmd) {
    if (cmd.kind == filter_command::kind::ENABLE)
        return fmt::format("enable ({}K)", cmd.temperature);
    return "disable";
}

}
