/***
 * Name: test_channel
 * Purpose: Bounded/unbounded channel status codes, close semantics and draining.
 */
#include <gtest/gtest.h>
#include "tether/sync/Channel.h"
#include <memory>
#include <string>
#include <thread>
#include <vector>

using tether::sync::Channel;
using tether::sync::ChannelStatus;

TEST(Channel, BoundedReportsFullAtCapacity) {
  Channel<int> ch(2);
  int a = 1;
  int b = 2;
  int c = 3;
  EXPECT_EQ(ch.try_send(a), ChannelStatus::Ok);
  EXPECT_EQ(ch.try_send(b), ChannelStatus::Ok);
  EXPECT_EQ(ch.try_send(c), ChannelStatus::Full);
  EXPECT_EQ(ch.size(), 2u);
  int out = 0;
  ASSERT_EQ(ch.try_recv(out), ChannelStatus::Ok);
  EXPECT_EQ(out, 1);
  EXPECT_EQ(ch.try_send(c), ChannelStatus::Ok);
}

TEST(Channel, UnboundedNeverFull) {
  Channel<int> ch;
  for (int i = 0; i < 1000; ++i) {
    int v = i;
    ASSERT_EQ(ch.try_send(v), ChannelStatus::Ok);
  }
  EXPECT_EQ(ch.size(), 1000u);
  EXPECT_EQ(ch.capacity(), 0u);
}

TEST(Channel, FailedSendLeavesItemWithCaller) {
  Channel<std::unique_ptr<std::string>> ch(1);
  auto first = std::make_unique<std::string>("first");
  auto second = std::make_unique<std::string>("second");
  ASSERT_EQ(ch.try_send(first), ChannelStatus::Ok);
  EXPECT_EQ(ch.try_send(second), ChannelStatus::Full);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(*second, "second");
  ch.close();
  EXPECT_EQ(ch.send(second), ChannelStatus::Closed);
  ASSERT_NE(second, nullptr);
}

TEST(Channel, EmptyThenClosedWithoutBlocking) {
  Channel<int> ch(4);
  int out = 0;
  EXPECT_EQ(ch.try_recv(out), ChannelStatus::Empty);
  int v = 7;
  ASSERT_EQ(ch.try_send(v), ChannelStatus::Ok);
  ch.close();
  EXPECT_TRUE(ch.is_closed());
  // Items queued before close are still delivered.
  EXPECT_EQ(ch.recv(out), ChannelStatus::Ok);
  EXPECT_EQ(out, 7);
  EXPECT_EQ(ch.recv(out), ChannelStatus::Closed);
  EXPECT_EQ(ch.try_recv(out), ChannelStatus::Closed);
}

TEST(Channel, CloseWakesBlockedReceiver) {
  Channel<int> ch;
  ChannelStatus seen = ChannelStatus::Ok;
  std::thread rx([&] {
    int out = 0;
    seen = ch.recv(out);
  });
  ch.close();
  rx.join();
  EXPECT_EQ(seen, ChannelStatus::Closed);
}

TEST(Channel, BlockingSendWaitsForRoom) {
  Channel<int> ch(1);
  int first = 1;
  ASSERT_EQ(ch.send(first), ChannelStatus::Ok);
  std::thread tx([&] {
    int second = 2;
    EXPECT_EQ(ch.send(second), ChannelStatus::Ok);
  });
  std::vector<int> got;
  for (int i = 0; i < 2; ++i) {
    int out = 0;
    ASSERT_EQ(ch.recv(out), ChannelStatus::Ok);
    got.push_back(out);
  }
  tx.join();
  EXPECT_EQ(got, (std::vector<int>{1, 2}));
}

TEST(Channel, DrainReturnsQueuedItemsInOrder) {
  Channel<int> ch;
  for (int i = 0; i < 3; ++i) {
    int v = i;
    ASSERT_EQ(ch.try_send(v), ChannelStatus::Ok);
  }
  ch.close();
  const auto rest = ch.drain();
  ASSERT_EQ(rest.size(), 3u);
  EXPECT_EQ(rest.front(), 0);
  EXPECT_EQ(rest.back(), 2);
  EXPECT_EQ(ch.size(), 0u);
}

TEST(Channel, StatusNames) {
  EXPECT_STREQ(tether::sync::to_string(ChannelStatus::Full), "Full");
  EXPECT_STREQ(tether::sync::to_string(ChannelStatus::Closed), "Closed");
}
