#include "sandbox/limiter.hpp"

#include <signal.h>

#include "gtest/gtest.h"

namespace {

using namespace sandbox;

Limits TestLimits() {
  Limits limits;
  limits.cpu_time_millis = 1000;
  limits.wall_time_millis = 2000;
  limits.memory_bytes = 1 << 20;
  limits.output_bytes = 100;
  return limits;
}

TEST(ResourceLimiterTest, NoBreachWithinLimits) {
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.Observe(2000, 1000, 1 << 20), Breach::NONE);
  EXPECT_EQ(limiter.AdmitOutput(100), 100u);
  EXPECT_EQ(limiter.breach(), Breach::NONE);
  EXPECT_EQ(limiter.peak_memory_bytes(), 1 << 20);
}

TEST(ResourceLimiterTest, ZeroDisablesLimits) {
  ResourceLimiter limiter(Limits(), nullptr);
  EXPECT_EQ(limiter.Observe(1 << 30, 1 << 30, 1LL << 40), Breach::NONE);
  EXPECT_EQ(limiter.AdmitOutput(1 << 20), static_cast<size_t>(1 << 20));
}

TEST(ResourceLimiterTest, WallTime) {
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.Observe(2001, 0, 0), Breach::WALL_TIME);
}

TEST(ResourceLimiterTest, CpuTime) {
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.Observe(10, 1001, 0), Breach::CPU_TIME);
}

TEST(ResourceLimiterTest, CpuTimeSignal) {
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.ObserveSignal(SIGSEGV), Breach::NONE);
  EXPECT_EQ(limiter.ObserveSignal(SIGXCPU), Breach::CPU_TIME);
}

TEST(ResourceLimiterTest, MemoryPeakIsKept) {
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.Observe(0, 0, 1000), Breach::NONE);
  EXPECT_EQ(limiter.Observe(0, 0, 500), Breach::NONE);
  EXPECT_EQ(limiter.peak_memory_bytes(), 1000);
  EXPECT_EQ(limiter.Observe(0, 0, (1 << 20) + 1), Breach::MEMORY);
  EXPECT_EQ(limiter.Observe(0, 0, 10), Breach::MEMORY);
  EXPECT_EQ(limiter.peak_memory_bytes(), (1 << 20) + 1);
}

TEST(ResourceLimiterTest, OutOfMemoryKill) {
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.Observe(0, 0, 1000), Breach::NONE);
  EXPECT_EQ(limiter.ObserveOutOfMemory(), Breach::MEMORY);
  // The kill happened at the ceiling, whatever the sampled peak was.
  EXPECT_EQ(limiter.peak_memory_bytes(), 1000);
  EXPECT_EQ(limiter.Observe(5000, 5000, 0), Breach::MEMORY);
}

TEST(ResourceLimiterTest, OutputIsCutAtTheCeiling) {
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.AdmitOutput(60), 60u);
  EXPECT_EQ(limiter.AdmitOutput(60), 40u);
  EXPECT_EQ(limiter.breach(), Breach::OUTPUT);
  EXPECT_EQ(limiter.AdmitOutput(60), 0u);
  EXPECT_EQ(limiter.output_bytes(), 180);
}

TEST(ResourceLimiterTest, Cancellation) {
  std::atomic<bool> cancelled{false};
  ResourceLimiter limiter(TestLimits(), &cancelled);
  EXPECT_EQ(limiter.Observe(0, 0, 0), Breach::NONE);
  cancelled = true;
  EXPECT_EQ(limiter.Observe(0, 0, 0), Breach::CANCELLED);
}

TEST(ResourceLimiterTest, FirstBreachIsSticky) {
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.AdmitOutput(200), 100u);
  EXPECT_EQ(limiter.Observe(5000, 5000, 1 << 30), Breach::OUTPUT);
  EXPECT_EQ(limiter.ObserveSignal(SIGXCPU), Breach::OUTPUT);
}

TEST(ResourceLimiterTest, SameSampleOrder) {
  std::atomic<bool> cancelled{true};
  ResourceLimiter cancelled_limiter(TestLimits(), &cancelled);
  EXPECT_EQ(cancelled_limiter.Observe(5000, 5000, 1 << 30), Breach::CANCELLED);
  ResourceLimiter limiter(TestLimits(), nullptr);
  EXPECT_EQ(limiter.Observe(5000, 5000, 1 << 30), Breach::WALL_TIME);
}

}  // namespace
