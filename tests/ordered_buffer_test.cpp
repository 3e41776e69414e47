#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "ethstorage/utils/ordered_buffer.hpp"
#include "fakes.hpp"

using namespace ethstorage::utils;

class OrderedBufferTest : public ::testing::Test {
protected:
  void SetUp() override {
    ethstorage::test::quiet_logging();
  }

  OrderedBuffer<std::string>::Sink recorder() {
    return [this](std::size_t index, std::string&& item) {
      indexes.push_back(index);
      items.push_back(std::move(item));
    };
  }

  std::vector<std::size_t> indexes;
  std::vector<std::string> items;
};

TEST_F(OrderedBufferTest, InOrderPushesFlushImmediately) {
  OrderedBuffer<std::string> buffer(0, recorder());
  EXPECT_EQ(buffer.push(0, "a"), 1u);
  EXPECT_EQ(buffer.push(1, "b"), 1u);
  EXPECT_EQ(items, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(buffer.next_index(), 2u);
}

TEST_F(OrderedBufferTest, HoldsItemsUntilGapFills) {
  OrderedBuffer<std::string> buffer(0, recorder());
  EXPECT_EQ(buffer.push(2, "c"), 0u);
  EXPECT_EQ(buffer.push(1, "b"), 0u);
  EXPECT_EQ(buffer.pending(), 2u);
  EXPECT_TRUE(items.empty());

  EXPECT_EQ(buffer.push(0, "a"), 3u);
  EXPECT_EQ(indexes, (std::vector<std::size_t>{0, 1, 2}));
  EXPECT_EQ(items, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(buffer.pending(), 0u);
}

TEST_F(OrderedBufferTest, StartsAtFirstIndex) {
  OrderedBuffer<std::string> buffer(5, recorder());
  buffer.push(6, "g");
  buffer.push(5, "f");
  EXPECT_EQ(indexes, (std::vector<std::size_t>{5, 6}));
}

TEST_F(OrderedBufferTest, RejectsDuplicatesAndStaleIndexes) {
  OrderedBuffer<std::string> buffer(0, recorder());
  buffer.push(0, "a");
  buffer.push(2, "c");
  EXPECT_THROW(buffer.push(0, "again"), std::logic_error);
  EXPECT_THROW(buffer.push(2, "again"), std::logic_error);
}

TEST_F(OrderedBufferTest, ConcurrentProducersDeliverInOrder) {
  constexpr std::size_t count = 200;
  std::vector<std::size_t> order(count);
  for (std::size_t i = 0; i < count; ++i) order[i] = i;
  std::shuffle(order.begin(), order.end(), std::mt19937(42));

  std::vector<std::size_t> seen;
  OrderedBuffer<std::size_t> buffer(0, [&seen](std::size_t index, std::size_t&&) { seen.push_back(index); });

  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (std::size_t i = t; i < count; i += 4) {
        buffer.push(order[i], order[i]);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  ASSERT_EQ(seen.size(), count);
  for (std::size_t i = 0; i < count; ++i) {
    EXPECT_EQ(seen[i], i);
  }
}
