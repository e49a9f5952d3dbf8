//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace
{

using namespace wolbot::daemon::engine;  // NOLINT This our main concern here in the unit tests.

using testing::ElementsAre;
using testing::Eq;
using testing::IsEmpty;
using testing::Optional;
using testing::Pair;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestConfig : public testing::Test
{
protected:
    void SetUp() override
    {
        const auto* const test_info = testing::UnitTest::GetInstance()->current_test_info();
        file_path_ = "/tmp/wolbot_test_" + std::to_string(::getpid()) + "_" + test_info->name() + ".toml";
    }

    void TearDown() override
    {
        (void) std::remove(file_path_.c_str());
    }

    Config::Ptr makeConfig(const std::string& content) const
    {
        {
            std::ofstream file{file_path_};
            file << content;
        }
        return Config::make(file_path_);
    }

    // NOLINTBEGIN
    std::string file_path_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestConfig, full)
{
    const auto config = makeConfig(R"(
[bot]
allowed_users = [1000, 123456789]

[wol]
interface = "eth0"
probe_timeout = 3

[devices]
nas = ["00:11:22:33:44:55", "192.168.1.10"]
desktop = ["AA-BB-CC-DD-EE-FF", "desktop.lan", "90"]

[ipc]
connections = ["unix:/var/run/wolbotd/wolbotd.sock"]

[daemon]
user = "wolbot"

[logging]
file = "/var/log/wolbotd.log"
level = "debug"
flush_level = "warn"
)");
    ASSERT_TRUE(config);

    EXPECT_THAT(config->getAllowedUsers(), ElementsAre(1000U, 123456789U));
    EXPECT_THAT(config->getWolInterface(), Optional(Eq(std::string{"eth0"})));
    EXPECT_THAT(config->getWolProbeTimeout(), std::chrono::seconds{3});
    EXPECT_THAT(config->getDevices(),
                ElementsAre(Pair("desktop", ElementsAre("AA-BB-CC-DD-EE-FF", "desktop.lan", "90")),
                            Pair("nas", ElementsAre("00:11:22:33:44:55", "192.168.1.10"))));
    EXPECT_THAT(config->getIpcConnections(), ElementsAre("unix:/var/run/wolbotd/wolbotd.sock"));
    EXPECT_THAT(config->getDaemonUser(), Optional(Eq(std::string{"wolbot"})));
    EXPECT_THAT(config->getLoggingFile(), Optional(Eq(std::string{"/var/log/wolbotd.log"})));
    EXPECT_THAT(config->getLoggingLevel(), Optional(Eq(std::string{"debug"})));
    EXPECT_THAT(config->getLoggingFlushLevel(), Optional(Eq(std::string{"warn"})));
}

TEST_F(TestConfig, empty_gives_defaults)
{
    const auto config = makeConfig("");
    ASSERT_TRUE(config);

    EXPECT_THAT(config->getAllowedUsers(), IsEmpty());
    EXPECT_FALSE(config->getWolInterface().has_value());
    EXPECT_THAT(config->getWolProbeTimeout(), std::chrono::seconds{1});
    EXPECT_THAT(config->getDevices(), IsEmpty());
    EXPECT_THAT(config->getIpcConnections(), IsEmpty());
    EXPECT_FALSE(config->getDaemonUser().has_value());
    EXPECT_FALSE(config->getLoggingFile().has_value());
    EXPECT_FALSE(config->getLoggingLevel().has_value());
    EXPECT_FALSE(config->getLoggingFlushLevel().has_value());
}

TEST_F(TestConfig, invalid_values_are_skipped)
{
    const auto config = makeConfig(R"(
[bot]
allowed_users = [1000, -1, "admin", 2000]

[wol]
interface = 42
probe_timeout = 0

[devices]
nas = ["00:11:22:33:44:55", "192.168.1.10"]
broken = "00:11:22:33:44:66"
mixed = ["00:11:22:33:44:77", 10]

[daemon]
user = ""
)");
    ASSERT_TRUE(config);

    EXPECT_THAT(config->getAllowedUsers(), ElementsAre(1000U, 2000U));
    EXPECT_FALSE(config->getWolInterface().has_value());
    EXPECT_THAT(config->getWolProbeTimeout(), std::chrono::seconds{1});
    EXPECT_THAT(config->getDevices(), ElementsAre(Pair("nas", ElementsAre("00:11:22:33:44:55", "192.168.1.10"))));
    EXPECT_FALSE(config->getDaemonUser().has_value());
}

TEST_F(TestConfig, allowed_users_of_wrong_type)
{
    const auto config = makeConfig(R"(
[bot]
allowed_users = 1000
)");
    ASSERT_TRUE(config);
    EXPECT_THAT(config->getAllowedUsers(), IsEmpty());
}

TEST_F(TestConfig, malformed_file_throws)
{
    EXPECT_THROW((void) makeConfig("[bot\nallowed_users = ["), std::exception);
}

TEST_F(TestConfig, missing_file_throws)
{
    EXPECT_THROW((void) Config::make(file_path_ + ".missing"), std::exception);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
