// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <filesystem>
#include <thread>
#include <unistd.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sundiald/status.hpp>
#include <sundiald/phase.hpp>
#include <sundiald/file.hpp>

using namespace sundiald;
using namespace std::chrono;

class status_test : public ::testing::Test {
protected:
    std::filesystem::path filepath;

    void SetUp() override {
        filepath = std::filesystem::temp_directory_path() / ("sundiald-status-" + std::to_string(getpid()) + ".json");
    }

    void TearDown() override {
        std::filesystem::remove(filepath);
    }

    // the observer writes asynchronously
    std::optional<nlohmann::json> wait_for_phase(const std::string &name) {
        const auto deadline = steady_clock::now() + seconds(5);
        while (steady_clock::now() < deadline) {
            const auto j = status_read(filepath);
            if (j && j->value("phase", "") == name)
                return j;
            std::this_thread::sleep_for(milliseconds(10));
        }
        return std::nullopt;
    }
};

TEST(status, to_json) {
    const status_data data {long(phase::DAYTIME), 21594, 65228, 1000};
    const auto j = status_to_json(data, 42);
    EXPECT_EQ(j["phase"], "daytime");
    EXPECT_EQ(j["sunrise"], "05:59:54");
    EXPECT_EQ(j["sunset"], "18:07:08");
    EXPECT_EQ(j["next_wake"], 1000);
    EXPECT_EQ(j["updated"], 42);
}

TEST_F(status_test, read_missing_file) {
    EXPECT_FALSE(status_read(filepath).has_value());
}

TEST_F(status_test, read_corrupted_file) {
    file_write(filepath, "{ nope");
    EXPECT_FALSE(status_read(filepath).has_value());
}

TEST_F(status_test, nothing_written_before_first_cycle) {
    channel<status_data> ch(status_idle);
    {
        status_observer observer(ch, filepath);
        std::this_thread::sleep_for(milliseconds(50));
        EXPECT_FALSE(std::filesystem::exists(filepath));
    }
}

TEST_F(status_test, observer_follows_channel_and_cleans_up) {
    channel<status_data> ch(status_idle);
    {
        status_observer observer(ch, filepath);

        EXPECT_TRUE(ch.send({long(phase::BEFORE_DAYTIME), 21594, 65228, 21594}));
        auto j = wait_for_phase("before daytime");
        ASSERT_TRUE(j.has_value());
        EXPECT_EQ((*j)["next_wake"], 21594);

        EXPECT_FALSE(ch.send({long(phase::BEFORE_DAYTIME), 21594, 65228, 21594}));

        EXPECT_TRUE(ch.send({long(phase::DAYTIME), 21594, 65228, 65228}));
        j = wait_for_phase("daytime");
        ASSERT_TRUE(j.has_value());
        EXPECT_EQ((*j)["sunset"], "18:07:08");
        EXPECT_EQ((*j)["next_wake"], 65228);
    }
    EXPECT_FALSE(std::filesystem::exists(filepath));
}
