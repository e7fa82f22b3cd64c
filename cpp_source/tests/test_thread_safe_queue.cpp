// tests/test_thread_safe_queue.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "thread_safe_queue.hpp"

using namespace std::chrono_literals;

TEST(ThreadQueue, FifoOrder) {
  ThreadQueue<int> q(4);
  EXPECT_TRUE(q.empty());
  for (int i = 0; i < 3; ++i)
    EXPECT_TRUE(q.push(i));
  EXPECT_EQ(q.size(), 3u);

  int v = -1;
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(q.try_pop(v));
    EXPECT_EQ(v, i);
  }
  EXPECT_FALSE(q.try_pop(v));
}

TEST(ThreadQueue, DropOldestCountsOverwrites) {
  ThreadQueue<int> q(2, true);
  q.push(1);
  q.push(2);
  q.push(3);
  EXPECT_EQ(q.get_dropped_count(), 1u);

  int v = 0;
  ASSERT_TRUE(q.try_pop(v));
  EXPECT_EQ(v, 2);
}

TEST(ThreadQueue, CloseWakesConsumerAfterDrain) {
  ThreadQueue<int> q(8);
  std::vector<int> seen;
  std::thread consumer([&] {
    int v;
    while (q.wait_and_pop(v))
      seen.push_back(v);
  });

  q.push(10);
  q.push(11);
  q.close();
  consumer.join();

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], 10);
  EXPECT_EQ(seen[1], 11);
  EXPECT_TRUE(q.closed());
  EXPECT_FALSE(q.push(12));
}

TEST(ThreadQueue, BlockingPushWaitsForSpace) {
  ThreadQueue<int> q(1);
  ASSERT_TRUE(q.push(1));

  std::atomic<bool> pushed{false};
  std::thread producer([&] {
    q.push(2); // blocks until the consumer makes room
    pushed = true;
  });

  std::this_thread::sleep_for(20ms);
  EXPECT_FALSE(pushed.load());

  int v = 0;
  ASSERT_TRUE(q.wait_and_pop(v));
  EXPECT_EQ(v, 1);
  producer.join();
  EXPECT_TRUE(pushed.load());
  ASSERT_TRUE(q.try_pop(v));
  EXPECT_EQ(v, 2);
  EXPECT_EQ(q.get_dropped_count(), 0u);
}
