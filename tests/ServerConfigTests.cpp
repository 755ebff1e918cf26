/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "../src/Streaming/Core/DatapathFault.h"
#include "../src/Streaming/Core/ServerConfig.h"

using namespace Datapath::Streaming;

namespace {

class ServerConfigTests : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        ::unsetenv("DATAPATH_MAX_THREADS");
        ::unsetenv("DATAPATH_SOCKET_PATH");
    }
};

} // namespace

TEST_F(ServerConfigTests, DefaultsWithoutEnvironment) {
    auto config = ServerConfig::fromEnvironment();
    ASSERT_TRUE(config.success()) << config.errorMessage;

    EXPECT_EQ(config.value.maxThreads, DEFAULT_MAX_THREADS);
    EXPECT_EQ(config.value.clientThreshold(), DEFAULT_MAX_THREADS / 2);
    EXPECT_EQ(config.value.queueJoinTimeout, std::chrono::seconds(10));
    EXPECT_EQ(config.value.socketPath, "/tmp/datapath.sock");
}

TEST_F(ServerConfigTests, EnvironmentOverrides) {
    ::setenv("DATAPATH_MAX_THREADS", "8", 1);
    ::setenv("DATAPATH_SOCKET_PATH", "/tmp/elsewhere.sock", 1);

    auto config = ServerConfig::fromEnvironment();
    ASSERT_TRUE(config.success()) << config.errorMessage;
    EXPECT_EQ(config.value.maxThreads, 8u);
    EXPECT_EQ(config.value.clientThreshold(), 4u);
    EXPECT_EQ(config.value.socketPath, "/tmp/elsewhere.sock");
}

TEST_F(ServerConfigTests, MalformedThreadCountIsRejected) {
    for (const char* bad : {"", "0", "-4", "12abc", "99999999999"}) {
        ::setenv("DATAPATH_MAX_THREADS", bad, 1);
        auto config = ServerConfig::fromEnvironment();
        EXPECT_TRUE(config.failed()) << bad;
        EXPECT_EQ(config.error, DatapathError::InvalidParameter) << bad;
    }
}

TEST_F(ServerConfigTests, OddBudgetRoundsThresholdDown) {
    ServerConfig config;
    config.maxThreads = 3;
    EXPECT_EQ(config.clientThreshold(), 1u);
    config.maxThreads = 1;
    EXPECT_EQ(config.clientThreshold(), 0u);
}

TEST(StatusCodeTests, RecoverabilityFollowsCode) {
    EXPECT_FALSE(DatapathFault(StatusCode::InvalidArgument, "").recoverable());
    EXPECT_FALSE(DatapathFault(StatusCode::NotFound, "").recoverable());
    EXPECT_FALSE(DatapathFault(StatusCode::FailedPrecondition, "").recoverable());
    EXPECT_FALSE(DatapathFault(StatusCode::Aborted, "").recoverable());

    EXPECT_TRUE(DatapathFault(StatusCode::Unavailable, "").recoverable());
    EXPECT_TRUE(DatapathFault(StatusCode::Internal, "").recoverable());
    EXPECT_TRUE(DatapathFault(StatusCode::DeadlineExceeded, "").recoverable());

    EXPECT_STREQ(statusCodeToString(StatusCode::ResourceExhausted), "RESOURCE_EXHAUSTED");
}
