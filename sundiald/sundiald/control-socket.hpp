// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONTROL_SOCKET_HPP
#define CONTROL_SOCKET_HPP

#include <filesystem>
#include <string_view>
#include <stop_token>
#include <chrono>
#include <sundiald/control.hpp>

namespace sundiald {

// hyprsunset IPC: one short-lived unix socket connection per command.
class socket_control : public filter_control {
    std::filesystem::path sock_path_;
    void send(std::string_view msg);
public:
    socket_control(std::filesystem::path sock_path);
    void enable(int temperature) override;
    void disable() override;
    std::string name() const override;
};

// $XDG_RUNTIME_DIR/hypr/$HYPRLAND_INSTANCE_SIGNATURE/.hyprsunset.sock
std::filesystem::path hyprsunset_socket_path();

// Polls for sock_path to appear, every interval, at most tries times.
// Throws if it never does; returns early (without throwing) on stop request.
void wait_for_socket(const std::filesystem::path &sock_path,
                     int tries,
                     std::chrono::milliseconds interval,
                     std::stop_token stoken);

}

#endif // CONTROL_SOCKET_HPP
