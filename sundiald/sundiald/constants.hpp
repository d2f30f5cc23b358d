// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <string_view>

namespace sundiald {
namespace constants {
extern const std::string_view flock_filename;
extern const std::string_view status_filename;
extern const std::string_view config_filename;
extern const std::string_view default_program;
extern const std::string_view hypr_dirname;
extern const std::string_view hyprsunset_socket_filename;
extern const int temp_k_min;
extern const int temp_k_max;
extern const int socket_timeout_ms;
extern const int process_exit_timeout_ms;
}}

#endif // CONSTANTS_HPP
