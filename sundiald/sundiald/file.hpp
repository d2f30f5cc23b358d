// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef FILE_HPP
#define FILE_HPP

#include <string>
#include <string_view>
#include <filesystem>
#include <optional>
#include <sys/types.h>

namespace sundiald {

// Advisory flock(2) on filepath, held for the lifetime of the object.
// Contention is not an error: check acquired().
class lockfile {
    std::filesystem::path filepath_;
    int fd_;
    bool acquired_;
public:
    lockfile(std::filesystem::path filepath);
    lockfile(const lockfile &) = delete;
    lockfile &operator=(const lockfile &) = delete;
    ~lockfile();

    bool acquired() const;
    std::filesystem::path path() const;

    // Removes the file and unlocks it. Safe to call more than once.
    void release();
};

// Whether fd is open on the file filepath currently names.
bool same_file(int fd, const std::filesystem::path &filepath);

// The pid recorded by a lockfile holder, if that process is alive.
// Never locks, creates or removes anything.
std::optional<pid_t> lockfile_owner(const std::filesystem::path &filepath);

std::string file_read(std::filesystem::path filepath);
void file_write(std::filesystem::path filepath, std::string_view data);

std::string env(std::string_view var);
std::string env_required(std::string_view var);

// Searches PATH like execvp() would. Paths containing a slash are checked as-is.
std::optional<std::filesystem::path> find_program(std::string_view name);

// https://specifications.freedesktop.org/basedir-spec/basedir-spec-latest.html
std::filesystem::path xdg_config_dir();
std::filesystem::path xdg_state_dir();
std::filesystem::path xdg_runtime_dir();
}

#endif // FILE_HPP
