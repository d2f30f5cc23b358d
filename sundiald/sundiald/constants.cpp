// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <sundiald/constants.hpp>
#include <string_view>

namespace sundiald {
namespace constants {
constexpr std::string_view flock_filename             = "sundiald.lock";
constexpr std::string_view status_filename            = "sundiald-status.json";
constexpr std::string_view config_filename            = "sundiald.json";
constexpr std::string_view default_program            = "hyprsunset";
constexpr std::string_view hypr_dirname               = "hypr";
constexpr std::string_view hyprsunset_socket_filename = ".hyprsunset.sock";
constexpr int temp_k_min              = 1000;
constexpr int temp_k_max              = 20000;
constexpr int socket_timeout_ms       = 500;
constexpr int process_exit_timeout_ms = 1000;
}}
