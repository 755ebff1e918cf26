/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/Streaming/Session/SessionRegistry.h"

using namespace Datapath::Streaming;

namespace {

struct SessionRegistryTests : public ::testing::Test {
    int shutdowns = 0;
    std::vector<ClientId> released;
    SessionRegistry registry{2, [this] { ++shutdowns; }};

    SessionRegistry::ReleaseAllCallback recordRelease() {
        return [this](const ClientId& id) { released.push_back(id); };
    }
};

} // namespace

TEST_F(SessionRegistryTests, AdmitsNewClientAndCounts) {
    auto now = SessionClock::now();
    auto ticket = registry.admit("c1", false, now);
    ASSERT_TRUE(ticket.success()) << ticket.errorMessage;

    EXPECT_EQ(ticket.value.clientId, "c1");
    EXPECT_FALSE(ticket.value.resumed);
    EXPECT_NE(ticket.value.cache, nullptr);
    EXPECT_EQ(registry.activeCount(), 1u);
    EXPECT_TRUE(registry.contains("c1"));
    EXPECT_FALSE(registry.gracePeriod("c1").has_value());
}

TEST_F(SessionRegistryTests, ReconnectResumesSameSessionWithoutSecondIncrement) {
    auto first = registry.admit("c1", false, SessionClock::now());
    ASSERT_TRUE(first.success());
    ASSERT_TRUE(registry.setGracePeriod("c1", 5));

    auto second = registry.admit("c1", true, SessionClock::now());
    ASSERT_TRUE(second.success());

    EXPECT_TRUE(second.value.resumed);
    EXPECT_EQ(second.value.cache, first.value.cache);
    EXPECT_GT(second.value.epoch, first.value.epoch);
    EXPECT_EQ(registry.activeCount(), 1u);
    EXPECT_EQ(registry.gracePeriod("c1"), std::optional<int32_t>(5));
}

TEST_F(SessionRegistryTests, NonReconnectingClientResumesLiveEntry) {
    auto first = registry.admit("c1", false, SessionClock::now());
    auto second = registry.admit("c1", false, SessionClock::now());
    ASSERT_TRUE(second.success());
    EXPECT_TRUE(second.value.resumed);
    EXPECT_EQ(registry.activeCount(), 1u);
}

TEST_F(SessionRegistryTests, ReconnectWithoutSessionIsNotFound) {
    auto ticket = registry.admit("ghost", true, SessionClock::now());
    ASSERT_TRUE(ticket.failed());
    EXPECT_EQ(ticket.error, DatapathError::SessionNotFound);
    EXPECT_EQ(ticket.errorMessage, "Attempted to reconnect to a session that has already been cleaned up.");
    EXPECT_FALSE(registry.contains("ghost"));
    EXPECT_EQ(registry.activeCount(), 0u);
}

TEST_F(SessionRegistryTests, ThresholdRejectsNewClientWithoutEntry) {
    ASSERT_TRUE(registry.admit("a", false, SessionClock::now()).success());
    ASSERT_TRUE(registry.admit("b", false, SessionClock::now()).success());

    auto rejected = registry.admit("c", false, SessionClock::now());
    ASSERT_TRUE(rejected.failed());
    EXPECT_EQ(rejected.error, DatapathError::ResourceExhausted);
    EXPECT_FALSE(registry.contains("c"));
    EXPECT_EQ(registry.activeCount(), 2u);

    // Existing sessions may still reconnect at the threshold
    auto resumed = registry.admit("a", true, SessionClock::now());
    EXPECT_TRUE(resumed.success());
}

TEST_F(SessionRegistryTests, FinishRemovesSessionAndRunsShutdownOnLastClient) {
    auto a = registry.admit("a", false, SessionClock::now());
    auto b = registry.admit("b", false, SessionClock::now());

    EXPECT_EQ(registry.finishConnection(a.value, recordRelease()), TeardownOutcome::Removed);
    EXPECT_EQ(shutdowns, 0);
    EXPECT_FALSE(registry.contains("a"));

    EXPECT_EQ(registry.finishConnection(b.value, recordRelease()), TeardownOutcome::RemovedLastClient);
    EXPECT_EQ(shutdowns, 1);
    EXPECT_EQ(registry.activeCount(), 0u);
    EXPECT_EQ(released, (std::vector<ClientId>{"a", "b"}));
}

TEST_F(SessionRegistryTests, SecondTeardownIsNoOp) {
    auto a = registry.admit("a", false, SessionClock::now());
    EXPECT_EQ(registry.finishConnection(a.value, recordRelease()), TeardownOutcome::RemovedLastClient);
    EXPECT_EQ(registry.finishConnection(a.value, recordRelease()), TeardownOutcome::AlreadyRemoved);

    EXPECT_EQ(shutdowns, 1);
    EXPECT_EQ(released.size(), 1u);
    EXPECT_EQ(registry.activeCount(), 0u);
}

TEST_F(SessionRegistryTests, StaleTeardownSkippedAfterReconnect) {
    auto start = SessionClock::now();
    auto old = registry.admit("c1", false, start);
    // Same clock reading: only the epoch tells the connections apart
    auto fresh = registry.admit("c1", true, start);

    EXPECT_EQ(registry.finishConnection(old.value, recordRelease()), TeardownOutcome::Reconnected);
    EXPECT_TRUE(registry.contains("c1"));
    EXPECT_TRUE(released.empty());

    EXPECT_EQ(registry.finishConnection(fresh.value, recordRelease()), TeardownOutcome::RemovedLastClient);
    EXPECT_FALSE(registry.contains("c1"));
}

TEST_F(SessionRegistryTests, LaterLastSeenSkipsTeardown) {
    auto start = SessionClock::now();
    auto old = registry.admit("c1", false, start);
    auto fresh = registry.admit("c1", true, start + std::chrono::milliseconds(10));
    ASSERT_TRUE(fresh.success());

    EXPECT_EQ(registry.finishConnection(old.value, recordRelease()), TeardownOutcome::Reconnected);
}

TEST_F(SessionRegistryTests, ReleaseFailureStillRemovesSession) {
    auto a = registry.admit("a", false, SessionClock::now());
    auto outcome = registry.finishConnection(a.value, [](const ClientId&) {
        throw std::runtime_error("backend gone");
    });
    EXPECT_EQ(outcome, TeardownOutcome::RemovedLastClient);
    EXPECT_FALSE(registry.contains("a"));
    EXPECT_EQ(shutdowns, 1);
}

TEST_F(SessionRegistryTests, GracePeriodRequiresSession) {
    EXPECT_FALSE(registry.setGracePeriod("nobody", 3));
    registry.admit("c1", false, SessionClock::now());
    EXPECT_TRUE(registry.setGracePeriod("c1", 0));
    EXPECT_EQ(registry.gracePeriod("c1"), std::optional<int32_t>(0));
}

TEST_F(SessionRegistryTests, SnapshotReportsSessions) {
    auto a = registry.admit("a", false, SessionClock::now());
    registry.setGracePeriod("a", 7);
    a.value.cache->check(1);

    auto sessions = registry.snapshot();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].clientId, "a");
    EXPECT_EQ(sessions[0].epoch, a.value.epoch);
    EXPECT_EQ(sessions[0].gracePeriodSeconds, std::optional<int32_t>(7));
    EXPECT_EQ(sessions[0].cachedResponses, 1u);
}

TEST_F(SessionRegistryTests, RunLockedReturnsValue) {
    int value = registry.runLocked([] { return 42; });
    EXPECT_EQ(value, 42);
    EXPECT_EQ(std::string(teardownOutcomeToString(TeardownOutcome::Reconnected)), "Reconnected");
}
