#include "lanshare/network/http_server.hpp"

#include <gtest/gtest.h>

using namespace lanshare::network;
using std::chrono::milliseconds;

TEST(AcceptRetryDelayTest, NoPauseWithoutFailures) {
    EXPECT_EQ(accept_retry_delay(0), milliseconds(0));
}

TEST(AcceptRetryDelayTest, DoublesFromTenMilliseconds) {
    EXPECT_EQ(accept_retry_delay(1), milliseconds(10));
    EXPECT_EQ(accept_retry_delay(2), milliseconds(20));
    EXPECT_EQ(accept_retry_delay(3), milliseconds(40));
    EXPECT_EQ(accept_retry_delay(7), milliseconds(640));
}

TEST(AcceptRetryDelayTest, CappedAtOneSecond) {
    EXPECT_EQ(accept_retry_delay(8), milliseconds(1000));
    EXPECT_EQ(accept_retry_delay(1000), milliseconds(1000));
    EXPECT_EQ(accept_retry_delay(~0u), milliseconds(1000));
}
