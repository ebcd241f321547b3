/**
 * @file endpoint_registry_test.cpp
 * @brief Unit tests for EndpointRegistry identity tracking and events
 */

#include "peerrelay/EndpointRegistry.h"
#include "TestChannels.h"
#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace PeerRelay;
using PeerRelay::testing_support::RecordingChannel;
using PeerRelay::testing_support::registerRecording;

TEST(EndpointRegistryTest, RegisterThenLookupReturnsSnapshot) {
    EndpointRegistry registry;
    auto channel = std::make_shared<RecordingChannel>();
    RelayError error;

    ASSERT_TRUE(registry.registerEndpoint("alice", channel, {{"webrtc", "true"}}, "Laptop", error));

    auto endpoint = registry.lookup("alice");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->id, "alice");
    EXPECT_EQ(endpoint->deviceName, "Laptop");
    EXPECT_EQ(endpoint->capabilities.at("webrtc"), "true");
    EXPECT_EQ(endpoint->channel.get(), channel.get());
}

TEST(EndpointRegistryTest, DuplicateIdentityIsRejectedAndExistingSessionKept) {
    EndpointRegistry registry;
    auto first = registerRecording(registry, "alice");
    ASSERT_NE(first, nullptr);

    auto second = std::make_shared<RecordingChannel>();
    RelayError error;
    EXPECT_FALSE(registry.registerEndpoint("alice", second, {}, "", error));
    EXPECT_EQ(error.code, ErrorCodes::DUPLICATE_IDENTITY);

    auto endpoint = registry.lookup("alice");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->channel.get(), first.get());
}

TEST(EndpointRegistryTest, EmptyIdIsMalformed) {
    EndpointRegistry registry;
    RelayError error;
    EXPECT_FALSE(registry.registerEndpoint("", std::make_shared<RecordingChannel>(), {}, "", error));
    EXPECT_EQ(error.code, ErrorCodes::MALFORMED_MESSAGE);
}

TEST(EndpointRegistryTest, LookupAfterDeregisterIsAbsent) {
    EndpointRegistry registry;
    ASSERT_NE(registerRecording(registry, "alice"), nullptr);

    EXPECT_TRUE(registry.deregisterEndpoint("alice"));
    EXPECT_FALSE(registry.lookup("alice").has_value());
    EXPECT_FALSE(registry.isRegistered("alice"));
    EXPECT_FALSE(registry.send("alice", {{"type", "ping"}}));
}

TEST(EndpointRegistryTest, DeregisterIsIdempotentAndEmitsLeftOnce) {
    EndpointRegistry registry;
    std::vector<std::pair<EndpointEvent, std::string>> events;
    registry.subscribe([&](EndpointEvent event, const std::string& id) {
        events.emplace_back(event, id);
    });

    ASSERT_NE(registerRecording(registry, "alice"), nullptr);
    EXPECT_TRUE(registry.deregisterEndpoint("alice"));
    EXPECT_FALSE(registry.deregisterEndpoint("alice"));
    EXPECT_FALSE(registry.deregisterEndpoint("never-registered"));

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].first, EndpointEvent::JOINED);
    EXPECT_EQ(events[1].first, EndpointEvent::LEFT);
    EXPECT_EQ(events[1].second, "alice");
}

TEST(EndpointRegistryTest, DeregisterWithStaleChannelKeepsNewerSession) {
    EndpointRegistry registry;
    auto oldChannel = registerRecording(registry, "alice");
    ASSERT_NE(oldChannel, nullptr);
    ASSERT_TRUE(registry.deregisterEndpoint("alice"));

    auto newChannel = registerRecording(registry, "alice");
    ASSERT_NE(newChannel, nullptr);

    // The old connection's reader shutting down late must not evict the new one.
    EXPECT_FALSE(registry.deregisterEndpoint("alice", oldChannel.get()));
    EXPECT_TRUE(registry.isRegistered("alice"));
    EXPECT_TRUE(registry.deregisterEndpoint("alice", newChannel.get()));
}

TEST(EndpointRegistryTest, SendReportsTransportFailure) {
    EndpointRegistry registry;
    auto channel = registerRecording(registry, "alice");
    ASSERT_NE(channel, nullptr);

    EXPECT_TRUE(registry.send("alice", {{"type", "pong"}}));
    channel->setFailSends(true);
    EXPECT_FALSE(registry.send("alice", {{"type", "pong"}}));
    EXPECT_EQ(channel->countOf("pong"), 1u);
}

TEST(EndpointRegistryTest, BroadcastSkipsExcludedAndSurvivesFailures) {
    EndpointRegistry registry;
    auto alice = registerRecording(registry, "alice");
    auto bob = registerRecording(registry, "bob");
    auto carol = registerRecording(registry, "carol");
    ASSERT_TRUE(alice && bob && carol);

    bob->setFailSends(true);
    registry.broadcast({{"type", "notice"}}, "alice");

    EXPECT_EQ(alice->countOf("notice"), 0u);
    EXPECT_EQ(bob->countOf("notice"), 0u);
    EXPECT_EQ(carol->countOf("notice"), 1u);
}

TEST(EndpointRegistryTest, UpdateProfileEmitsUpdated) {
    EndpointRegistry registry;
    std::vector<EndpointEvent> events;
    registry.subscribe([&](EndpointEvent event, const std::string&) { events.push_back(event); });

    ASSERT_NE(registerRecording(registry, "alice", "Old"), nullptr);
    EXPECT_TRUE(registry.updateProfile("alice", {{"relay", "1"}}, "New"));
    EXPECT_FALSE(registry.updateProfile("bob", {}, "x"));

    auto endpoint = registry.lookup("alice");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->deviceName, "New");
    EXPECT_EQ(endpoint->capabilities.at("relay"), "1");

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1], EndpointEvent::UPDATED);
}

TEST(EndpointRegistryTest, StaleEndpointsAndCloseEndpoint) {
    EndpointRegistry registry;
    auto alice = registerRecording(registry, "alice");
    ASSERT_NE(alice, nullptr);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    auto stale = registry.staleEndpoints(10);
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0], "alice");

    registry.touch("alice");
    EXPECT_TRUE(registry.staleEndpoints(10000).empty());

    EXPECT_TRUE(registry.closeEndpoint("alice"));
    EXPECT_TRUE(alice->isClosed());
    EXPECT_FALSE(registry.closeEndpoint("bob"));
}

TEST(EndpointRegistryTest, ConcurrentRegistrationOfSameIdAdmitsExactlyOne) {
    EndpointRegistry registry;
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            RelayError error;
            if (registry.registerEndpoint("shared", std::make_shared<RecordingChannel>(), {}, "", error)) {
                successes.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(registry.size(), 1u);
}
