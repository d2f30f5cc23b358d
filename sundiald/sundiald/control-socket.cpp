// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>

#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <sundiald/control-socket.hpp>
#include <sundiald/constants.hpp>
#include <sundiald/file.hpp>
#include <sundiald/wakeup.hpp>

namespace {

class unix_socket {
    int fd_;
public:
    unix_socket() : fd_(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
        if (fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "socket()");
        }
    }
    unix_socket(const unix_socket &) = delete;
    unix_socket &operator=(const unix_socket &) = delete;
    ~unix_socket() {
        close(fd_);
    }
    int fd() const {
        return fd_;
    }
};

void set_timeout(int fd, int optname, std::chrono::milliseconds ms) {
    const timeval tv {
        .tv_sec  = static_cast<time_t>(ms.count() / 1000),
        .tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000),
    };
    if (setsockopt(fd, SOL_SOCKET, optname, &tv, sizeof(tv)) < 0) {
        throw std::system_error(errno, std::generic_category(), "failed to set socket timeout");
    }
}

}

namespace sundiald {

socket_control::socket_control(std::filesystem::path sock_path)
    : sock_path_(sock_path) {
    if (sock_path_.native().size() >= sizeof(sockaddr_un::sun_path)) {
        throw std::invalid_argument(fmt::format("socket path too long: {}", sock_path_));
    }
}

void socket_control::send(std::string_view msg) {
    unix_socket sock;

    sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path_.c_str(), sizeof(addr.sun_path) - 1);

    // the peer never answers, don't let a stuck controller hang us
    const std::chrono::milliseconds timeout(constants::socket_timeout_ms);
    set_timeout(sock.fd(), SO_RCVTIMEO, timeout);
    set_timeout(sock.fd(), SO_SNDTIMEO, timeout);

    if (connect(sock.fd(), reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) < 0) {
        throw std::system_error(errno, std::generic_category(), fmt::format("failed to connect to {}", sock_path_));
    }

    size_t sent = 0;
    while (sent < msg.size()) {
        const ssize_t ret = ::send(sock.fd(), msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), fmt::format("failed to send \"{}\" to {}", msg, sock_path_));
        }
        sent += size_t(ret);
    }

    spdlog::debug("[socket_control] sent \"{}\"", msg);
}

void socket_control::enable(int temperature) {
    send(fmt::format("temperature {}", temperature));
}

void socket_control::disable() {
    send("identity");
}

std::string socket_control::name() const {
    return fmt::format("socket ({})", sock_path_);
}

std::filesystem::path hyprsunset_socket_path() {
    const std::string signature = env_required("HYPRLAND_INSTANCE_SIGNATURE");
    return xdg_runtime_dir() / constants::hypr_dirname / signature / constants::hyprsunset_socket_filename;
}

void wait_for_socket(const std::filesystem::path &sock_path,
                     int tries,
                     std::chrono::milliseconds interval,
                     std::stop_token stoken) {
    for (int i = 0; i < tries; ++i) {
        std::error_code ec;
        if (std::filesystem::exists(sock_path, ec)) {
            spdlog::info("[socket_control] found {}", sock_path);
            return;
        }

        spdlog::info("[socket_control] {} does not exist, retrying in {}ms ({}/{})", sock_path, interval.count(), i + 1, tries);
        jthread_wait_until(interval, stoken);

        if (stoken.stop_requested())
            return;
    }

    throw std::runtime_error(fmt::format("{} did not appear after {} tries", sock_path, tries));
}

}
