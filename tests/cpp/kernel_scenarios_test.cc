// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// The fixture scenarios under tests/kernels, driven end to end through the
// harness on the host-emulated accelerator.

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "include/host_accelerator.h"
#include "ktest/rng/seed_stream.h"
#include "ktest/rng/xoroshiro.h"
#include "ktest/runtime/harness.h"
#include "ktest/validate/reference_validator.h"
#include "ktest/workload/descriptor.h"

using ktest::core::HarnessConfig;
using ktest::runtime::DispatchHarness;
using ktest::runtime::ProgramSource;
using ktest::runtime::testonly::HostAccelerator;
using ktest::runtime::testonly::register_fixture_kernels;
using ktest::validate::Tolerance;
using ktest::workload::WorkloadBuilder;

using namespace std::chrono_literals;

namespace {

constexpr std::uint64_t kInvocations = 640000;
constexpr std::size_t kWords = ktest::rng::kXoroshiro128PlusWords;

std::unique_ptr<DispatchHarness> make_harness() {
  auto acc = std::make_unique<HostAccelerator>();
  register_fixture_kernels(*acc);
  return std::make_unique<DispatchHarness>(std::move(acc), HarnessConfig{});
}

ProgramSource source(const char* entry) {
  ProgramSource src;
  src.path = std::string(entry) + ".ptx";
  src.entry_point = entry;
  src.local_size = {64, 1, 1};
  return src;
}

} // namespace

TEST(KernelScenariosTest, PushConstantsLinearFunction) {
  constexpr float a = 4.0f;
  constexpr float b = 10.0f;
  auto h = make_harness();
  const auto desc = WorkloadBuilder()
                        .buffer<float>("result", kInvocations)
                        .constant("a", a)
                        .constant("b", b)
                        .extent(100, 100, 1)
                        .build();
  auto wl = h->allocate(desc, h->load_program(source("push_constants_main")));
  ASSERT_EQ(wl->total_invocations(), kInvocations);

  h->run(*wl, 10s);

  auto result = h->acquire_read<float>(wl->buffer("result"), 1s);
  const auto report = ktest::validate::check<float>(
      result.span(), wl->total_invocations(),
      [&](std::uint64_t i) { return a * static_cast<float>(i) + b; },
      Tolerance::absolute_only(1e-4));
  EXPECT_TRUE(report.ok()) << report.message();
  EXPECT_EQ(report.compared, kInvocations);
}

TEST(KernelScenariosTest, XoroshiroLockstepAgainstSeedBuffer) {
  auto h = make_harness();
  const auto desc = WorkloadBuilder()
                        .buffer<std::uint64_t>("prng", kInvocations * kWords)
                        .buffer<std::uint64_t>("result", kInvocations)
                        .extent(100, 100, 1)
                        .build();
  auto wl = h->allocate(desc, h->load_program(source("random_main")));

  ktest::rng::SeedStream seeds(0x5eedull);
  ktest::rng::SeedStream replica = seeds;
  {
    auto prng = h->acquire_write<std::uint64_t>(wl->buffer("prng"), 1s);
    for (auto& w : prng) w = seeds.next_u64();
  }

  h->run(*wl, 10s);

  auto state = h->acquire_read<std::uint64_t>(wl->buffer("prng"), 1s);
  auto result = h->acquire_read<std::uint64_t>(wl->buffer("result"), 1s);
  const auto report = ktest::validate::check_lockstep<std::uint64_t, kWords, std::uint64_t>(
      state.span(), result.span(), wl->total_invocations(),
      [&] { return replica.next_u64(); },
      [](std::array<std::uint64_t, kWords>& s) {
        return ktest::rng::xoroshiro128plus_next(s.data());
      });
  EXPECT_TRUE(report.ok()) << report.message();
  EXPECT_EQ(report.compared, kInvocations);
}

TEST(KernelScenariosTest, ElementwiseExampleWrapsLikeTheDevice) {
  constexpr std::uint32_t n = 64 * 1024;
  auto h = make_harness();
  const auto desc = WorkloadBuilder()
                        .buffer<std::uint32_t>("data", n)
                        .buffer<std::uint32_t>("result", n)
                        .extent(n / 64)
                        .build();
  auto wl = h->allocate(desc, h->load_program(source("example_main")));
  {
    auto data = h->acquire_write<std::uint32_t>(wl->buffer("data"), 1s);
    for (std::uint32_t i = 0; i < n; ++i) data[i] = 0xFFFF0000u + i;
  }
  h->run(*wl, 10s);

  auto result = h->acquire_read<std::uint32_t>(wl->buffer("result"), 1s);
  ktest::validate::require_ok(ktest::validate::check<std::uint32_t>(
      result.span(), wl->total_invocations(), [](std::uint64_t i) {
        return static_cast<std::uint32_t>(0xFFFF0000u + i) * static_cast<std::uint32_t>(i);
      }));
}
