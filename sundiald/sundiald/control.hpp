// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONTROL_HPP
#define CONTROL_HPP

#include <memory>
#include <string>
#include <stop_token>
#include <sundiald/phase.hpp>

namespace sundiald {

class config;

// Drives the external display-color controller.
// Every method throws on failure; callers decide whether that is fatal.
class filter_control {
public:
    virtual ~filter_control() = default;
    virtual void enable(int temperature) = 0;
    virtual void disable() = 0;
    virtual std::string name() const = 0;

    void apply(const filter_command &cmd);
};

// Builds the binding selected in conf. Startup checks (socket endpoint,
// program availability) happen here and throw.
std::unique_ptr<filter_control> make_control(const config &conf, std::stop_token stoken);

}

#endif // CONTROL_HPP
