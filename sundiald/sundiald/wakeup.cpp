// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <sundiald/wakeup.hpp>

namespace sundiald {

void jthread_wait_until(std::chrono::milliseconds ms, std::stop_token stoken) {
    using namespace std::chrono;
    std::mutex mutex;
    std::unique_lock lock(mutex);
    std::condition_variable_any()
            .wait_until(lock, stoken, system_clock::now() + ms, [&] { return stoken.stop_requested(); });
}

wakeup::reason wakeup::wait_for(std::chrono::milliseconds ms, std::stop_token stoken) {
    using namespace std::chrono;
    std::unique_lock lock(mutex_);

    const bool woken = cv_.wait_until(lock, stoken, system_clock::now() + ms, [this] { return pending_; });

    if (stoken.stop_requested())
        return reason::STOPPED;

    if (woken) {
        pending_ = false;
        return reason::WOKEN;
    }

    return reason::TIMEOUT;
}

void wakeup::notify() {
    {
        std::lock_guard lock(mutex_);
        pending_ = true;
    }
    cv_.notify_all();
}

}
