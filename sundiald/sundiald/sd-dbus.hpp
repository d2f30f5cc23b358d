// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SD_DBUS_HPP
#define SD_DBUS_HPP

#include <string>
#include <memory>
#include <functional>
#include <sdbus-c++/IProxy.h>

namespace sundiald {
namespace dbus {

std::unique_ptr<sdbus::IProxy> register_signal_handler(
    std::string service,
    std::string obj_path,
    std::string interface,
    std::string signal_name,
    std::function<void(sdbus::Signal &signal)> handler);

// logind PrepareForSleep. fn receives true before suspend, false after resume.
// The handler runs on the proxy's own event loop thread.
std::unique_ptr<sdbus::IProxy> on_system_sleep(std::function<void(bool sleep)> fn);

} // namespace dbus
} // namespace sundiald

#endif // SD_DBUS_HPP
