#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>
#include "core/event_channel.hpp"
#include "test_utils.hpp"

using namespace pasteall::core;

class EventChannelTest : public ::testing::Test {
protected:
  void SetUp() override {
    pasteall::test::init_logging();
  }

  static Event status_event(const std::string& id) {
    return PairingStatusEvent{id, PairingStatus::Paired};
  }

  static std::string id_of(const Event& event) {
    return std::get<PairingStatusEvent>(event).device_id;
  }
};

TEST_F(EventChannelTest, StartsEmpty) {
  EventChannel channel;
  Event event;
  EXPECT_TRUE(channel.empty());
  EXPECT_EQ(channel.size(), 0u);
  EXPECT_FALSE(channel.consume(event));
}

TEST_F(EventChannelTest, PreservesOrder) {
  EventChannel channel;
  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(channel.produce(status_event(std::to_string(i))));
  }
  EXPECT_EQ(channel.size(), 5u);

  Event event;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(channel.consume(event));
    EXPECT_EQ(id_of(event), std::to_string(i));
  }
  EXPECT_TRUE(channel.empty());
}

TEST_F(EventChannelTest, FullChannelDropsOldest) {
  EventChannel channel(3);
  EXPECT_TRUE(channel.produce(status_event("a")));
  EXPECT_TRUE(channel.produce(status_event("b")));
  EXPECT_TRUE(channel.produce(status_event("c")));
  EXPECT_FALSE(channel.produce(status_event("d")));
  EXPECT_EQ(channel.size(), 3u);
  EXPECT_EQ(channel.dropped(), 1u);

  Event event;
  ASSERT_TRUE(channel.consume(event));
  EXPECT_EQ(id_of(event), "b");
}

TEST_F(EventChannelTest, WaitConsumeTimesOut) {
  EventChannel channel;
  Event event;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.wait_consume(event, std::chrono::milliseconds(50)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST_F(EventChannelTest, WaitConsumeWakesOnProduce) {
  EventChannel channel;
  std::thread producer([&channel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.produce(status_event("late"));
  });

  Event event;
  EXPECT_TRUE(channel.wait_consume(event, std::chrono::seconds(2)));
  EXPECT_EQ(id_of(event), "late");
  producer.join();
}

TEST_F(EventChannelTest, ConcurrentProducers) {
  EventChannel channel(10000);
  const int producers = 4;
  const int per_producer = 250;

  std::vector<std::thread> threads;
  for (int p = 0; p < producers; ++p) {
    threads.emplace_back([&channel, p]() {
      for (int i = 0; i < per_producer; ++i) {
        channel.produce(status_event(std::to_string(p) + ":" + std::to_string(i)));
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  std::set<std::string> received;
  Event event;
  while (channel.consume(event)) {
    received.insert(id_of(event));
  }
  EXPECT_EQ(received.size(), static_cast<std::size_t>(producers * per_producer));
}

TEST_F(EventChannelTest, EventNames) {
  EXPECT_FALSE(event_name(DeviceDiscoveredEvent{}).empty());
  EXPECT_NE(event_name(TransferEvent{}), event_name(ClipboardReceivedEvent{}));
}
