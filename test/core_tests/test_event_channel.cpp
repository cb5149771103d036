#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "core/event_channel.hpp"

using ssdpkit::core::EventChannel;
using ssdpkit::core::ListenerId;

class EventChannelTest : public testing::Test {
 protected:
  EventChannel<std::string> channel_;
};

TEST_F(EventChannelTest, DeliversToAllListenersInOrder) {
  std::vector<std::string> seen;
  channel_.connect([&](const std::string& e) { seen.push_back("a:" + e); });
  channel_.connect([&](const std::string& e) { seen.push_back("b:" + e); });

  channel_.emit("x");

  EXPECT_EQ(seen, (std::vector<std::string>{"a:x", "b:x"}));
  EXPECT_EQ(channel_.size(), 2u);
}

TEST_F(EventChannelTest, DisconnectStopsDelivery) {
  int count = 0;
  const ListenerId id = channel_.connect([&](const std::string&) { ++count; });

  channel_.emit("first");
  EXPECT_TRUE(channel_.disconnect(id));
  EXPECT_FALSE(channel_.disconnect(id));
  channel_.emit("second");

  EXPECT_EQ(count, 1);
  EXPECT_EQ(channel_.size(), 0u);
}

TEST_F(EventChannelTest, IdsAreUnique) {
  const auto a = channel_.connect([](const std::string&) {});
  const auto b = channel_.connect([](const std::string&) {});
  EXPECT_NE(a, b);
}

/**
 * @brief 单个监听者抛出异常不影响其余监听者
 */
TEST_F(EventChannelTest, ThrowingListenerIsIsolated) {
  int count = 0;
  channel_.connect([](const std::string&) {
    throw std::runtime_error("listener failure");
  });
  channel_.connect([&](const std::string&) { ++count; });

  EXPECT_NO_THROW(channel_.emit("x"));
  EXPECT_EQ(count, 1);
}

TEST_F(EventChannelTest, ListenerMayDisconnectItselfDuringEmit) {
  int count = 0;
  ListenerId id = 0;
  id = channel_.connect([&](const std::string&) {
    ++count;
    channel_.disconnect(id);
  });

  channel_.emit("x");
  channel_.emit("y");
  EXPECT_EQ(count, 1);
}

TEST_F(EventChannelTest, ClearRemovesEveryListener) {
  channel_.connect([](const std::string&) {});
  channel_.connect([](const std::string&) {});
  channel_.clear();
  EXPECT_EQ(channel_.size(), 0u);
}
