// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

#include <sundiald/almanac.hpp>

namespace sundiald {
class config {

    void defaults();

    void file_parse();
    void file_pretty_write() const;

    void from_json(const nlohmann::json &in);
    void validate() const;

    std::filesystem::path filepath_;
public:

    enum class binding {
        SOCKET,
        PROCESS,
    };

    sundiald::location location;
    int temperature;

    binding bind;
    std::string program;

    int drift_delay_s;
    int socket_retries;

    static std::string binding_name(binding);
    static binding binding_from_name(const std::string &);

    // defaults, no file involved
    config();

    // Reads filepath, fills in missing keys with defaults and writes the result back.
    config(std::filesystem::path filepath);

    config(const nlohmann::json &in);

    nlohmann::json to_json() const;
    std::filesystem::path path() const;
};
}

#endif // CONFIG_HPP
