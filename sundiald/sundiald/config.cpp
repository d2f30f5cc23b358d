// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fstream>
#include <iomanip>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <sundiald/config.hpp>
#include <sundiald/file.hpp>
#include <sundiald/constants.hpp>

using nlohmann::json;
using namespace sundiald;

void config::defaults()
{
    // Nairobi
    location.latitude  = -1.2921;
    location.longitude = 36.8219;
    location.altitude  = 0.;

    temperature    = 3000;

    bind           = binding::SOCKET;
    program        = std::string(constants::default_program);

    drift_delay_s  = 60;
    socket_retries = 10;
}

std::string config::binding_name(binding b)
{
    switch (b) {
    case binding::SOCKET:
        return "socket";
    case binding::PROCESS:
        return "process";
    }
    return "error: unknown binding";
}

config::binding config::binding_from_name(const std::string &name)
{
    if (name == "socket")
        return binding::SOCKET;
    if (name == "process")
        return binding::PROCESS;
    throw std::invalid_argument(fmt::format("unknown binding \"{}\", expected \"socket\" or \"process\"", name));
}

config::config()
{
    defaults();
}

config::config(std::filesystem::path filepath)
    : filepath_(filepath)
{
    defaults();

    file_parse();

    validate();

    file_pretty_write();
}

config::config(const json &in)
{
    defaults();

    from_json(in);

    validate();
}

void config::from_json(const json &in)
{
    try {
        location.latitude  = in.value("latitude", location.latitude);
        location.longitude = in.value("longitude", location.longitude);
        location.altitude  = in.value("altitude", location.altitude);
        temperature        = in.value("temperature", temperature);
        bind               = binding_from_name(in.value("binding", binding_name(bind)));
        program            = in.value("program", program);
        drift_delay_s      = in.value("drift_delay_s", drift_delay_s);
        socket_retries     = in.value("socket_retries", socket_retries);
    } catch (const json::exception &e) {
        throw std::invalid_argument(fmt::format("[config] {}", e.what()));
    }
}

json config::to_json() const
{
    return {
        {"latitude", location.latitude},
        {"longitude", location.longitude},
        {"altitude", location.altitude},
        {"temperature", temperature},
        {"binding", binding_name(bind)},
        {"program", program},
        {"drift_delay_s", drift_delay_s},
        {"socket_retries", socket_retries},
    };
}

void config::validate() const
{
    sundiald::validate(location);

    if (temperature < constants::temp_k_min || temperature > constants::temp_k_max) {
        throw std::invalid_argument(fmt::format("temperature out of range [{}, {}]: {}",
                                                constants::temp_k_min, constants::temp_k_max, temperature));
    }

    if (program.empty()) {
        throw std::invalid_argument("program must not be empty");
    }

    if (drift_delay_s < 0) {
        throw std::invalid_argument(fmt::format("drift_delay_s must not be negative: {}", drift_delay_s));
    }

    if (socket_retries < 1) {
        throw std::invalid_argument(fmt::format("socket_retries must be at least 1: {}", socket_retries));
    }
}

std::filesystem::path config::path() const
{
    return filepath_;
}

void config::file_pretty_write() const
{
    if (filepath_.has_parent_path())
        std::filesystem::create_directories(filepath_.parent_path());
    std::ofstream fs(filepath_);
    fs.exceptions(std::fstream::failbit);
    fs << std::setw(4) << config::to_json() << '\n';
}

void config::file_parse()
{
    const std::string data = [&] {
        try {
            return file_read(filepath_);
        } catch (const std::ios_base::failure &e) {
            spdlog::info("[config] {} not found, writing defaults", filepath_);
            return std::string();
        }
    }();

    if (data.empty())
        return;

    const json jdata = [&] {
        try {
            return json::parse(data);
        } catch (const json::exception &e) {
            spdlog::warn("[config] {} is not valid json ({}), using defaults", filepath_, e.what());
            return json();
        }
    }();

    if (jdata.is_object()) {
        from_json(jdata);
    }
}
