#include "lanshare/client/connection_health.hpp"

#include <gtest/gtest.h>

using namespace lanshare::client;

TEST(ConnectionHealthTest, UnknownEndpointHasNoVerdict) {
    ConnectionHealthRegistry registry;
    const ConnectionHealth health = registry.get(Endpoint{"10.0.0.9", 8000});
    EXPECT_FALSE(health.responsive.has_value());
    EXPECT_EQ(health.last_known_file_count, 0u);
    EXPECT_EQ(health.age, std::chrono::duration<double>::max());
}

TEST(ConnectionHealthTest, SuccessThenFailure) {
    ConnectionHealthRegistry registry;
    const Endpoint endpoint{"192.168.1.20", 8000};

    registry.record_success(endpoint, 42);
    ConnectionHealth health = registry.get(endpoint);
    ASSERT_TRUE(health.responsive.has_value());
    EXPECT_TRUE(*health.responsive);
    EXPECT_EQ(health.last_known_file_count, 42u);
    EXPECT_LT(health.age.count(), 5.0);

    registry.record_failure(endpoint);
    health = registry.get(endpoint);
    ASSERT_TRUE(health.responsive.has_value());
    EXPECT_FALSE(*health.responsive);
    EXPECT_EQ(health.last_known_file_count, 42u);
}

TEST(ConnectionHealthTest, FailureForUnknownEndpointIsNotRecorded) {
    ConnectionHealthRegistry registry;
    registry.record_failure(Endpoint{"10.0.0.1", 8000});
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.record(Endpoint{"10.0.0.1", 8000}).has_value());
}

TEST(ConnectionHealthTest, PortIsPartOfTheKey) {
    ConnectionHealthRegistry registry;
    registry.record_success(Endpoint{"host", 8000}, 1);
    registry.record_success(Endpoint{"host", 8001}, 2);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(Endpoint("host", 8001).key(), "host:8001");

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}
