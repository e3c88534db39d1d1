// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "ktest/core/error.h"
#include "ktest/rng/seed_stream.h"
#include "ktest/rng/xoroshiro.h"
#include "ktest/validate/reference_validator.h"

using ktest::Error;
using ktest::ErrorKind;
using ktest::Phase;
using ktest::rng::SeedStream;
using ktest::validate::CheckReport;
using ktest::validate::Tolerance;
using ktest::validate::check;
using ktest::validate::check_lockstep;
using ktest::validate::require_ok;

namespace {

constexpr std::size_t kWords = ktest::rng::kXoroshiro128PlusWords;

auto xoroshiro_advance = [](std::array<std::uint64_t, kWords>& s) {
  return ktest::rng::xoroshiro128plus_next(s.data());
};

// Emulates the device side: seeds written in order, then advanced in place.
void run_device_replica(std::uint64_t seed, std::vector<std::uint64_t>& state,
                        std::vector<std::uint64_t>& output) {
  SeedStream gen(seed);
  for (auto& w : state) w = gen.next_u64();
  for (std::size_t i = 0; i < output.size(); ++i) {
    output[i] = ktest::rng::xoroshiro128plus_next(state.data() + kWords * i);
  }
}

} // namespace

TEST(ReferenceValidatorTest, IntegersCompareExactly) {
  const std::vector<std::uint32_t> device = {0, 2, 4, 6};
  auto report = check<std::uint32_t>(device, 4, [](std::uint64_t i) { return 2 * i; });
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.compared, 4u);

  const std::vector<std::uint32_t> off = {0, 2, 5, 6};
  report = check<std::uint32_t>(off, 4, [](std::uint64_t i) { return 2 * i; });
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(report.mismatch->index, 2u);
  EXPECT_EQ(report.mismatch->device_value, "5");
  EXPECT_EQ(report.mismatch->host_value, "4");
  EXPECT_EQ(report.compared, 2u);
  EXPECT_EQ(report.message(), "mismatch at invocation 2 (value): device=5 host=4");
}

TEST(ReferenceValidatorTest, VisitsEveryIndexExactlyOnceInOrder) {
  const std::vector<std::int64_t> device(1000, 0);
  std::vector<std::uint64_t> visited;
  auto report = check<std::int64_t>(device, device.size(), [&](std::uint64_t i) {
    visited.push_back(i);
    return std::int64_t{0};
  });
  EXPECT_TRUE(report.ok());
  ASSERT_EQ(visited.size(), 1000u);
  for (std::uint64_t i = 0; i < visited.size(); ++i) EXPECT_EQ(visited[i], i);
}

TEST(ReferenceValidatorTest, FloatsUseCombinedTolerance) {
  const Tolerance tol{1e-4, 1e-6};
  // Large magnitude: relative part dominates.
  const std::vector<float> device = {10.00005f, 2560000.0f};
  auto report = check<float>(device, 2,
                             [](std::uint64_t i) { return i == 0 ? 10.0f : 2560001.0f; }, tol);
  EXPECT_TRUE(report.ok()) << report.message();

  report = check<float>(std::vector<float>{10.01f}, 1, [](std::uint64_t) { return 10.0f; }, tol);
  EXPECT_FALSE(report.ok());

  report = check<float>(std::vector<float>{2560010.0f}, 1,
                        [](std::uint64_t) { return 2560000.0f; }, Tolerance::absolute_only(1e-4));
  EXPECT_FALSE(report.ok());
}

TEST(ReferenceValidatorTest, NaNAndInfinityHandling) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_TRUE(check<double>(std::vector<double>{nan}, 1, [&](std::uint64_t) { return nan; }).ok());
  EXPECT_FALSE(check<double>(std::vector<double>{nan}, 1, [](std::uint64_t) { return 1.0; }).ok());
  EXPECT_FALSE(check<double>(std::vector<double>{1.0}, 1, [&](std::uint64_t) { return nan; }).ok());
  EXPECT_TRUE(check<double>(std::vector<double>{inf}, 1, [&](std::uint64_t) { return inf; }).ok());
  EXPECT_FALSE(check<double>(std::vector<double>{-inf}, 1, [&](std::uint64_t) { return inf; }).ok());
}

TEST(ReferenceValidatorTest, WrongLengthIsReportedBeforeElements) {
  const std::vector<float> device(10, 0.0f);
  int calls = 0;
  auto report = check<float>(device, 12, [&](std::uint64_t) {
    ++calls;
    return 0.0f;
  });
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(report.mismatch->field, "length");
  EXPECT_EQ(calls, 0);
  EXPECT_NE(report.message().find("device has 10"), std::string::npos);
}

TEST(ReferenceValidatorTest, RequireOkThrowsValidationError) {
  EXPECT_NO_THROW(require_ok(CheckReport{}));
  auto report = check<std::uint32_t>(std::vector<std::uint32_t>{1}, 1,
                                     [](std::uint64_t) { return 2u; });
  try {
    require_ok(report);
    FAIL() << "expected ktest::Error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Validation);
    EXPECT_EQ(e.phase(), Phase::Validate);
    EXPECT_NE(std::string(e.what()).find("invocation 0"), std::string::npos);
  }
}

TEST(ReferenceValidatorTest, LockstepAcceptsMatchingReplica) {
  constexpr std::size_t n = 5000;
  std::vector<std::uint64_t> state(n * kWords);
  std::vector<std::uint64_t> output(n);
  run_device_replica(1234, state, output);

  SeedStream host(1234);
  auto report = check_lockstep<std::uint64_t, kWords, std::uint64_t>(
      state, output, n, [&] { return host.next_u64(); }, xoroshiro_advance);
  EXPECT_TRUE(report.ok()) << report.message();
  EXPECT_EQ(report.compared, n);
}

TEST(ReferenceValidatorTest, LockstepCatchesSeedDivergenceAtFirstIndex) {
  constexpr std::size_t n = 100;
  std::vector<std::uint64_t> state(n * kWords);
  std::vector<std::uint64_t> output(n);
  run_device_replica(99, state, output);
  state[2 * 37 + 1] ^= 1;  // corrupt the second word of invocation 37

  SeedStream host(99);
  auto report = check_lockstep<std::uint64_t, kWords, std::uint64_t>(
      state, output, n, [&] { return host.next_u64(); }, xoroshiro_advance);
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(report.mismatch->index, 37u);
  EXPECT_EQ(report.mismatch->field, "state[1]");
  EXPECT_EQ(report.compared, 37u);
}

TEST(ReferenceValidatorTest, LockstepCatchesOrderingBug) {
  constexpr std::size_t n = 16;
  std::vector<std::uint64_t> state(n * kWords);
  std::vector<std::uint64_t> output(n);
  run_device_replica(5, state, output);
  // Two invocations advanced in swapped order.
  std::swap(state[2 * 3], state[2 * 4]);
  std::swap(state[2 * 3 + 1], state[2 * 4 + 1]);
  std::swap(output[3], output[4]);

  SeedStream host(5);
  auto report = check_lockstep<std::uint64_t, kWords, std::uint64_t>(
      state, output, n, [&] { return host.next_u64(); }, xoroshiro_advance);
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(report.mismatch->index, 3u);
}

TEST(ReferenceValidatorTest, LockstepChecksOutputsToo) {
  constexpr std::size_t n = 8;
  std::vector<std::uint64_t> state(n * kWords);
  std::vector<std::uint64_t> output(n);
  run_device_replica(11, state, output);
  output[6] += 1;

  SeedStream host(11);
  auto report = check_lockstep<std::uint64_t, kWords, std::uint64_t>(
      state, output, n, [&] { return host.next_u64(); }, xoroshiro_advance);
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(report.mismatch->index, 6u);
  EXPECT_EQ(report.mismatch->field, "output");
}

TEST(ReferenceValidatorTest, LockstepStateSizeOverflowIsLengthMismatch) {
  std::vector<std::uint64_t> state;
  std::vector<std::uint64_t> output;
  int draws = 0;
  const std::uint64_t n = std::uint64_t{1} << 63;
  auto report = check_lockstep<std::uint64_t, kWords, std::uint64_t>(
      state, output, n, [&] { ++draws; return std::uint64_t{0}; }, xoroshiro_advance);
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(report.mismatch->field, "state length");
  EXPECT_NE(report.message().find("overflows"), std::string::npos);
  EXPECT_EQ(draws, 0);
}

TEST(ReferenceValidatorTest, LockstepRejectsShortStateBuffer) {
  std::vector<std::uint64_t> state(3);
  std::vector<std::uint64_t> output(2);
  SeedStream host(0);
  auto report = check_lockstep<std::uint64_t, kWords, std::uint64_t>(
      state, output, 2, [&] { return host.next_u64(); }, xoroshiro_advance);
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(report.mismatch->field, "state length");
}
