// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONTROL_PROCESS_HPP
#define CONTROL_PROCESS_HPP

#include <string>
#include <vector>
#include <chrono>
#include <string_view>
#include <filesystem>
#include <sys/types.h>
#include <sundiald/control.hpp>

namespace sundiald {

// Restarts the controller with the requested mode instead of talking to it.
class process_control : public filter_control {
    std::filesystem::path program_;
    void restart(const std::vector<std::string> &args);
public:
    process_control(std::string program);
    void enable(int temperature) override;
    void disable() override;
    std::string name() const override;
};

// live pids whose /proc/<pid>/comm is comm, excluding ourselves and zombies
std::vector<pid_t> find_processes(std::string_view comm);

// SIGTERM to every process named comm, then wait up to timeout for them to go away.
// Returns the number of processes that were signalled.
size_t terminate_processes(std::string_view comm, std::chrono::milliseconds timeout);

// Double fork so the child is reparented to init and never becomes our zombie.
void spawn_detached(const std::filesystem::path &program, const std::vector<std::string> &args);

}

#endif // CONTROL_PROCESS_HPP
