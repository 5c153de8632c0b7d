// Repository: Vidmark-player
// Component: LatencyTracker Contract Tests
// Purpose: Rolling decode-latency window used for adaptive buffer sizing
// Copyright (c) 2025 Vidmark

#include <gtest/gtest.h>

#include "vidmark/playback/LatencyTracker.hpp"

namespace vidmark::playback::testing {
namespace {

TEST(LatencyTrackerTest, EmptyAverageIsNeutral) {
  LatencyTracker tracker;
  EXPECT_TRUE(tracker.Empty());
  EXPECT_EQ(tracker.Count(), 0u);
  EXPECT_DOUBLE_EQ(tracker.Average(), 0.0);
  EXPECT_EQ(tracker.Capacity(), LatencyTracker::kDefaultCapacity);
}

TEST(LatencyTrackerTest, AverageOfRecordedSamples) {
  LatencyTracker tracker;
  tracker.Record(0.010);
  tracker.Record(0.020);
  tracker.Record(0.030);
  EXPECT_EQ(tracker.Count(), 3u);
  EXPECT_NEAR(tracker.Average(), 0.020, 1e-12);
}

// Capacity 10: recording 1..12 keeps 3..12.
TEST(LatencyTrackerTest, EvictsOldestBeyondCapacity) {
  LatencyTracker tracker;
  for (int i = 1; i <= 12; ++i) {
    tracker.Record(static_cast<double>(i));
  }
  EXPECT_EQ(tracker.Count(), 10u);
  EXPECT_DOUBLE_EQ(tracker.Average(), 7.5);
}

TEST(LatencyTrackerTest, CustomCapacity) {
  LatencyTracker tracker(2);
  tracker.Record(1.0);
  tracker.Record(2.0);
  tracker.Record(6.0);
  EXPECT_EQ(tracker.Count(), 2u);
  EXPECT_DOUBLE_EQ(tracker.Average(), 4.0);
}

TEST(LatencyTrackerTest, ClearForgetsSamples) {
  LatencyTracker tracker;
  tracker.Record(0.5);
  tracker.Clear();
  EXPECT_TRUE(tracker.Empty());
  EXPECT_DOUBLE_EQ(tracker.Average(), 0.0);

  tracker.Record(0.25);
  EXPECT_DOUBLE_EQ(tracker.Average(), 0.25);
}

}  // namespace
}  // namespace vidmark::playback::testing
