// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <array>
#include <fstream>
#include <filesystem>
#include <string>
#include <string_view>
#include <sstream>
#include <system_error>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>

#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <sundiald/file.hpp>

namespace sundiald {

lockfile::lockfile(std::filesystem::path filepath)
    : filepath_(filepath),
      fd_(-1),
      acquired_(false) {

    // A previous holder unlinks the file on release. Whoever opened it before
    // that can still lock the orphaned inode, which guards nothing: only a
    // lock on the file the path currently names counts.
    while (true) {
        fd_ = open(filepath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0640);
        if (fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), fmt::format("[lockfile] open({})", filepath_));
        }

        if (flock(fd_, LOCK_EX | LOCK_NB) < 0) {
            const int err = errno;
            if (err != EWOULDBLOCK) {
                close(fd_);
                fd_ = -1;
                throw std::system_error(err, std::generic_category(), fmt::format("[lockfile] flock({})", filepath_));
            }
            spdlog::debug("[lockfile] {} is held by another process", filepath_);
            return;
        }

        const bool current = [&] {
            try {
                return same_file(fd_, filepath_);
            } catch (const std::system_error &) {
                close(fd_);
                fd_ = -1;
                throw;
            }
        }();

        if (current) {
            break;
        }

        spdlog::debug("[lockfile] {} was replaced while locking, retrying", filepath_);
        close(fd_);
    }

    acquired_ = true;
    spdlog::debug("[lockfile] acquired {}", filepath_);

    const std::string pid = fmt::format("{}\n", getpid());
    if (ftruncate(fd_, 0) < 0 || write(fd_, pid.data(), pid.size()) != ssize_t(pid.size())) {
        spdlog::warn("[lockfile] failed to write pid to {}: {}", filepath_, std::strerror(errno));
    }
}

lockfile::~lockfile() {
    release();
}

bool lockfile::acquired() const {
    return acquired_;
}

std::filesystem::path lockfile::path() const {
    return filepath_;
}

void lockfile::release() {
    if (fd_ < 0)
        return;

    if (acquired_) {
        // unlink while still locked, see the constructor
        std::error_code ec;
        std::filesystem::remove(filepath_, ec);
        if (ec) {
            spdlog::error("[lockfile] failed to remove {}: {}", filepath_, ec.message());
        } else {
            spdlog::info("[lockfile] released {}", filepath_);
        }
        flock(fd_, LOCK_UN);
        acquired_ = false;
    }

    close(fd_);
    fd_ = -1;
}

bool same_file(int fd, const std::filesystem::path &filepath) {
    struct stat held, named;
    if (fstat(fd, &held) < 0) {
        throw std::system_error(errno, std::generic_category(), fmt::format("fstat({})", filepath));
    }
    if (stat(filepath.c_str(), &named) < 0) {
        return false;
    }
    return held.st_dev == named.st_dev && held.st_ino == named.st_ino;
}

std::optional<pid_t> lockfile_owner(const std::filesystem::path &filepath) {
    std::ifstream fs(filepath);
    pid_t pid = 0;
    if (!(fs >> pid) || pid <= 0) {
        return std::nullopt;
    }

    // EPERM: alive, but not ours to signal
    if (kill(pid, 0) == 0 || errno == EPERM) {
        return pid;
    }

    spdlog::debug("[lockfile] {} names {}, which is gone", filepath, pid);
    return std::nullopt;
}

std::string file_read(std::filesystem::path filepath) {
    std::ifstream fs(filepath);
    fs.exceptions(std::ifstream::failbit);

    std::ostringstream buf;
    buf << fs.rdbuf();

    return buf.str();
}

void file_write(std::filesystem::path filepath, std::string_view data) {
    std::ofstream fs(filepath);
    fs.exceptions(std::ofstream::failbit);
    fs.write(data.data(), data.size());
}

std::string env(std::string_view var) {
    const std::string name(var);
    const auto s = std::getenv(name.c_str());
    return s ? s : "";
}

std::string env_required(std::string_view var) {
    std::string ret = env(var);
    if (ret.empty()) {
        throw std::runtime_error(fmt::format("{} not set", var));
    }
    return ret;
}

std::optional<std::filesystem::path> find_program(std::string_view name) {
    const auto is_executable = [] (const std::filesystem::path &p) {
        std::error_code ec;
        return std::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string_view::npos) {
        const std::filesystem::path p(name);
        return is_executable(p) ? std::optional(p) : std::nullopt;
    }

    std::istringstream path_var(env("PATH"));
    std::string dir;
    while (std::getline(path_var, dir, ':')) {
        const std::filesystem::path p = std::filesystem::path(dir.empty() ? "." : dir) / name;
        if (is_executable(p))
            return p;
    }

    return std::nullopt;
}

std::filesystem::path xdg_config_dir() {
    constexpr std::array<std::array<std::string_view, 2>, 2> env_vars {{
        {"XDG_CONFIG_HOME", ""},
        {"HOME", "/.config"}
    }};

    std::filesystem::path ret;

    for (const auto &arr : env_vars) {
        const std::string env_var = env(arr[0]);
        if (!env_var.empty()) {
            ret = fmt::format("{}{}", env_var, arr[1]);
            break;
        }
    }

    if (ret.is_relative())
        throw std::runtime_error("xdg_config_dir should be absolute");

    return ret;
}

std::filesystem::path xdg_state_dir() {
    constexpr std::array<std::array<std::string_view, 2>, 2> env_vars {{
        {"XDG_STATE_HOME", ""},
        {"HOME", "/.local/state"}
    }};

    std::filesystem::path ret;

    for (const auto &arr : env_vars) {
        const std::string env_var = env(arr[0]);
        if (!env_var.empty()) {
            ret = fmt::format("{}{}", env_var, arr[1]);
            break;
        }
    }

    if (ret.is_relative())
        throw std::runtime_error("xdg_state_dir should be absolute");

    return ret;
}

// No fallback: the lock and the control socket both live here.
std::filesystem::path xdg_runtime_dir() {
    const std::filesystem::path ret(env_required("XDG_RUNTIME_DIR"));

    if (ret.is_relative())
        throw std::runtime_error("xdg_runtime_dir should be absolute");

    return ret;
}

} // namespace sundiald
