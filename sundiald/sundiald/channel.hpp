// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CHANNEL_HPP
#define CHANNEL_HPP

#include <atomic>
#include <cstring>
#include <type_traits>

namespace sundiald {

// Single-value mailbox. Receivers only wake when the value changes,
// so repeated identical sends are no-ops.
template <class T>
class channel {
    static_assert(std::has_unique_object_representations_v<T>, "channel<T> compares values bytewise");
    mutable T data_;
public:
    explicit channel(T data) : data_(data) {};

    T read() const {
        return std::atomic_ref(data_).load();
    }

    // Blocks until the value differs from old.
    T recv(T old) const {
        std::atomic_ref(data_).wait(old);
        return read();
    }

    // Returns false if nothing changed.
    bool send(T in) {
        const T prev = std::atomic_ref(data_).exchange(in);
        if (std::memcmp(&prev, &in, sizeof(T)) == 0) {
            return false;
        }
        std::atomic_ref(data_).notify_all();
        return true;
    }
};

}

#endif //CHANNEL_HPP
