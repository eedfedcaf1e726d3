#include <lootwatch/core/bounded_queue.hpp>
#include <gtest/gtest.h>
#include <thread>

namespace lc = lootwatch::core;

TEST(BoundedQueue, DropsWhenFull) {
  lc::BoundedQueue<int> q(2);
  EXPECT_TRUE(q.try_push(1));
  EXPECT_TRUE(q.try_push(2));
  EXPECT_FALSE(q.try_push(3));
  EXPECT_EQ(q.size(), 2u);
  EXPECT_EQ(q.pop(), 1);
  EXPECT_EQ(q.pop(), 2);
}

TEST(BoundedQueue, CloseWakesConsumer) {
  lc::BoundedQueue<int> q(4);
  std::optional<int> got{42};
  std::thread consumer([&]() { got = q.pop(); });
  q.close();
  consumer.join();
  EXPECT_FALSE(got.has_value());
  EXPECT_FALSE(q.try_push(1));
  EXPECT_TRUE(q.closed());
}

TEST(BoundedQueue, ClearReportsDiscarded) {
  lc::BoundedQueue<int> q(4);
  ASSERT_TRUE(q.try_push(1));
  ASSERT_TRUE(q.try_push(2));
  q.close();
  EXPECT_FALSE(q.pop().has_value());
  EXPECT_EQ(q.clear(), 2u);
  EXPECT_EQ(q.size(), 0u);
}

TEST(BoundedQueue, ZeroCapacityHoldsOne) {
  lc::BoundedQueue<int> q(0);
  EXPECT_EQ(q.capacity(), 1u);
  EXPECT_TRUE(q.try_push(1));
  EXPECT_FALSE(q.try_push(2));
}
