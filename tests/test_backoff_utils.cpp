#include <gtest/gtest.h>

#include <random>

#include "util/backoff_utils.hpp"

namespace hookrelay::monad {

TEST(BackoffUtilsTest, DoublesAndSaturatesWithoutJitter) {
  ExponentialBackoffOptions opts;
  opts.initial_delay = std::chrono::milliseconds(100);
  opts.max_delay = std::chrono::milliseconds(500);
  opts.jitter_ratio = 0.0;
  JitteredExponentialBackoff backoff(opts);
  std::mt19937 rng(7);

  EXPECT_EQ(backoff.NextDelay(rng).count(), 100);
  EXPECT_EQ(backoff.NextDelay(rng).count(), 200);
  EXPECT_EQ(backoff.NextDelay(rng).count(), 400);
  EXPECT_EQ(backoff.NextDelay(rng).count(), 500);
  EXPECT_EQ(backoff.NextDelay(rng).count(), 500);
  EXPECT_EQ(backoff.attempts(), 5);

  backoff.Reset();
  EXPECT_EQ(backoff.attempts(), 0);
  EXPECT_EQ(backoff.NextDelay(rng).count(), 100);
}

TEST(BackoffUtilsTest, JitterStaysWithinRatio) {
  ExponentialBackoffOptions opts;
  opts.initial_delay = std::chrono::milliseconds(1000);
  opts.max_delay = std::chrono::milliseconds(1000);
  opts.jitter_ratio = 0.2;
  JitteredExponentialBackoff backoff(opts);
  std::mt19937 rng(42);

  for (int i = 0; i < 200; ++i) {
    const auto d = backoff.NextDelay(rng).count();
    EXPECT_GE(d, 800);
    EXPECT_LE(d, 1200);
  }
}

TEST(BackoffUtilsTest, MaxBelowInitialUsesInitial) {
  ExponentialBackoffOptions opts;
  opts.initial_delay = std::chrono::milliseconds(300);
  opts.max_delay = std::chrono::milliseconds(100);
  opts.jitter_ratio = 0.0;
  JitteredExponentialBackoff backoff(opts);
  std::mt19937 rng(1);
  EXPECT_EQ(backoff.NextDelay(rng).count(), 300);
  EXPECT_EQ(backoff.NextDelay(rng).count(), 300);
}

} // namespace hookrelay::monad
