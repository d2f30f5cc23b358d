// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cerrno>
#include <csignal>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <sys/wait.h>

#include <fmt/core.h>
#include <fmt/std.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <sundiald/control-process.hpp>
#include <sundiald/constants.hpp>
#include <sundiald/file.hpp>
#include <sundiald/signals.hpp>

namespace {

// Orphans are reaped by init, which inside a container may never happen.
bool is_zombie(const std::filesystem::path &proc_dir) {
    std::ifstream fs(proc_dir / "stat");
    std::string stat;
    if (!fs || !std::getline(fs, stat))
        return false;

    // pid (comm) state ...
    const size_t pos = stat.rfind(')');
    return pos != std::string::npos && pos + 2 < stat.size() && stat[pos + 2] == 'Z';
}

}

namespace sundiald {

std::vector<pid_t> find_processes(std::string_view comm) {
    // the kernel truncates comm to 15 characters
    const std::string_view name = comm.substr(0, 15);
    const pid_t self = getpid();

    std::vector<pid_t> ret;
    std::error_code ec;

    for (const auto &entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string dirname = entry.path().filename();
        if (dirname.find_first_not_of("0123456789") != std::string::npos)
            continue;

        const pid_t pid = std::stoi(dirname);
        if (pid == self)
            continue;

        std::ifstream fs(entry.path() / "comm");
        std::string line;
        if (fs && std::getline(fs, line) && line == name && !is_zombie(entry.path())) {
            ret.push_back(pid);
        }
    }

    if (ec) {
        throw std::system_error(ec, "failed to list /proc");
    }

    return ret;
}

size_t terminate_processes(std::string_view comm, std::chrono::milliseconds timeout) {
    const std::vector<pid_t> pids = find_processes(comm);

    for (const pid_t pid : pids) {
        spdlog::debug("[process_control] SIGTERM -> {} ({})", comm, pid);
        if (kill(pid, SIGTERM) < 0 && errno != ESRCH) {
            throw std::system_error(errno, std::generic_category(), fmt::format("failed to terminate {} ({})", comm, pid));
        }
    }

    using namespace std::chrono;
    const auto deadline = steady_clock::now() + timeout;
    while (!pids.empty() && steady_clock::now() < deadline) {
        if (find_processes(comm).empty())
            break;
        std::this_thread::sleep_for(milliseconds(50));
    }

    return pids.size();
}

void spawn_detached(const std::filesystem::path &program, const std::vector<std::string> &args) {
    std::vector<std::string> argv_str;
    argv_str.reserve(args.size() + 1);
    argv_str.push_back(program.string());
    argv_str.insert(argv_str.end(), args.begin(), args.end());

    std::vector<char *> argv;
    for (auto &s : argv_str)
        argv.push_back(s.data());
    argv.push_back(nullptr);

    const pid_t pid = fork();

    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork() failed");
    }

    if (pid == 0) {
        // Only async-signal-safe calls from here on.
        if (fork() != 0) {
            _exit(0);
        }
        setsid();
        unblock_shutdown_signals();
        execv(argv[0], argv.data());
        _exit(127);
    }

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid() failed");
        }
    }
}

process_control::process_control(std::string program) {
    const auto path = find_program(program);
    if (!path) {
        throw std::runtime_error(fmt::format("{} is not installed (not found in PATH)", program));
    }
    program_ = *path;
    spdlog::info("[process_control] using {}", program_);
}

void process_control::restart(const std::vector<std::string> &args) {
    const std::string comm = program_.filename();

    const size_t terminated = terminate_processes(comm, std::chrono::milliseconds(constants::process_exit_timeout_ms));
    if (terminated > 0) {
        spdlog::debug("[process_control] terminated {} instance(s) of {}", terminated, comm);
    }

    spawn_detached(program_, args);
    spdlog::debug("[process_control] started {} {}", program_, fmt::join(args, " "));
}

void process_control::enable(int temperature) {
    restart({"--temperature", std::to_string(temperature)});
}

void process_control::disable() {
    restart({"--identity"});
}

std::string process_control::name() const {
    return fmt::format("process ({})", program_);
}

}
