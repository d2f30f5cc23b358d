// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <spdlog/spdlog.h>

#include <sundiald/control.hpp>
#include <sundiald/control-socket.hpp>
#include <sundiald/control-process.hpp>
#include <sundiald/config.hpp>

namespace sundiald {

void filter_control::apply(const filter_command &cmd) {
    switch (cmd.kind) {
    case filter_command::kind::ENABLE:
        enable(cmd.temperature);
        break;
    case filter_command::kind::DISABLE:
        disable();
        break;
    }
}

std::unique_ptr<filter_control> make_control(const config &conf, std::stop_token stoken) {
    switch (conf.bind) {
    case config::binding::SOCKET: {
        const auto sock_path = hyprsunset_socket_path();
        wait_for_socket(sock_path, conf.socket_retries, std::chrono::seconds(1), stoken);
        return std::make_unique<socket_control>(sock_path);
    }
    case config::binding::PROCESS:
        return std::make_unique<process_control>(conf.program);
    }
    throw std::logic_error("unknown binding");
}

}
