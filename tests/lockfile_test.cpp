// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <atomic>
#include <barrier>
#include <cstdlib>
#include <system_error>
#include <filesystem>
#include <thread>
#include <vector>
#include <unistd.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/wait.h>

#include <gtest/gtest.h>
#include <sundiald/file.hpp>

using namespace sundiald;

class lockfile_test : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / ("sundiald-lock-" + std::to_string(getpid()));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }
};

TEST_F(lockfile_test, creates_file_and_acquires) {
    const auto path = dir / "sundiald.lock";
    lockfile flock(path);
    EXPECT_TRUE(flock.acquired());
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(lockfile_test, second_attempt_fails) {
    const auto path = dir / "sundiald.lock";
    lockfile first(path);
    lockfile second(path);
    EXPECT_TRUE(first.acquired());
    EXPECT_FALSE(second.acquired());
}

TEST_F(lockfile_test, concurrent_attempts_yield_one_owner) {
    const auto path = dir / "sundiald.lock";
    std::barrier sync(2);
    std::atomic<int> owners = 0;
    std::atomic<int> refused = 0;

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 2; ++i) {
            threads.emplace_back([&] {
                sync.arrive_and_wait();
                lockfile flock(path);
                if (flock.acquired()) {
                    ++owners;
                } else {
                    ++refused;
                }
                // both attempts happen while the winner still holds the lock
                sync.arrive_and_wait();
            });
        }
    }

    EXPECT_EQ(owners, 1);
    EXPECT_EQ(refused, 1);
}

TEST_F(lockfile_test, release_removes_file_once) {
    const auto path = dir / "sundiald.lock";
    lockfile flock(path);
    ASSERT_TRUE(flock.acquired());

    flock.release();
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(flock.acquired());

    flock.release();
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(lockfile_test, lock_can_be_taken_after_release) {
    const auto path = dir / "sundiald.lock";
    {
        lockfile first(path);
        ASSERT_TRUE(first.acquired());
    }
    lockfile second(path);
    EXPECT_TRUE(second.acquired());
}

TEST_F(lockfile_test, loser_leaves_file_alone) {
    const auto path = dir / "sundiald.lock";
    lockfile first(path);
    {
        lockfile second(path);
        EXPECT_FALSE(second.acquired());
    }
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_TRUE(first.acquired());
}

TEST_F(lockfile_test, lock_on_unlinked_file_is_not_current) {
    const auto path = dir / "sundiald.lock";
    lockfile first(path);
    ASSERT_TRUE(first.acquired());

    // opened before the holder lets go, the way a racing instance would
    const int stale = open(path.c_str(), O_RDWR | O_CLOEXEC);
    ASSERT_GE(stale, 0);
    EXPECT_TRUE(same_file(stale, path));

    first.release();
    ASSERT_EQ(flock(stale, LOCK_EX | LOCK_NB), 0);
    EXPECT_FALSE(same_file(stale, path));

    lockfile next(path);
    EXPECT_TRUE(next.acquired());
    EXPECT_FALSE(same_file(stale, path));

    const int current = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    ASSERT_GE(current, 0);
    EXPECT_TRUE(same_file(current, path));

    close(current);
    close(stale);
}

TEST_F(lockfile_test, at_most_one_holder_under_churn) {
    const auto path = dir / "sundiald.lock";
    std::atomic<int> holders = 0;
    std::atomic<int> max_holders = 0;
    std::atomic<int> acquisitions = 0;

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&] {
                for (int n = 0; n < 2000; ++n) {
                    lockfile flock(path);
                    if (!flock.acquired())
                        continue;
                    const int now = ++holders;
                    int prev = max_holders.load();
                    while (prev < now && !max_holders.compare_exchange_weak(prev, now)) {}
                    ++acquisitions;
                    --holders;
                }
            });
        }
    }

    EXPECT_EQ(max_holders, 1);
    EXPECT_GT(acquisitions, 0);
}

TEST_F(lockfile_test, holder_records_its_pid) {
    const auto path = dir / "sundiald.lock";
    lockfile flock(path);
    ASSERT_TRUE(flock.acquired());
    EXPECT_EQ(lockfile_owner(path), getpid());

    // the loser must not overwrite it
    lockfile second(path);
    EXPECT_FALSE(second.acquired());
    EXPECT_EQ(lockfile_owner(path), getpid());

    flock.release();
    EXPECT_FALSE(lockfile_owner(path).has_value());
}

TEST_F(lockfile_test, owner_lookup_does_not_block_a_start) {
    const auto path = dir / "sundiald.lock";

    EXPECT_FALSE(lockfile_owner(path).has_value());
    EXPECT_FALSE(std::filesystem::exists(path));

    lockfile daemon(path);
    EXPECT_TRUE(daemon.acquired());
    EXPECT_EQ(lockfile_owner(path), getpid());
    EXPECT_TRUE(daemon.acquired());
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(lockfile_test, owner_of_stale_file_is_unknown) {
    const auto path = dir / "sundiald.lock";

    const pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        _exit(0);
    }
    ASSERT_EQ(waitpid(child, nullptr, 0), child);

    file_write(path, std::to_string(child) + "\n");
    EXPECT_FALSE(lockfile_owner(path).has_value());

    file_write(path, "garbage");
    EXPECT_FALSE(lockfile_owner(path).has_value());
}

TEST_F(lockfile_test, open_failure_throws) {
    EXPECT_THROW({ lockfile flock(dir / "missing-dir" / "sundiald.lock"); }, std::system_error);
}

TEST(file, find_program) {
    EXPECT_TRUE(find_program("sh").has_value());
    EXPECT_TRUE(find_program("/bin/sh").has_value());
    EXPECT_FALSE(find_program("sundiald-no-such-program").has_value());
    EXPECT_FALSE(find_program("").has_value());
}

TEST(file, env_required) {
    setenv("SUNDIALD_TEST_VAR", "x", 1);
    EXPECT_EQ(env_required("SUNDIALD_TEST_VAR"), "x");
    unsetenv("SUNDIALD_TEST_VAR");
    EXPECT_THROW(env_required("SUNDIALD_TEST_VAR"), std::runtime_error);
}
