// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Composed fixture kernels compiled to PTX at build time, run on a real
// device through the CUDA driver backend.

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "ktest/core/config.h"
#include "ktest/core/error.h"
#include "ktest/cuda/accelerator.h"
#include "ktest/cuda/device.h"
#include "ktest/rng/seed_stream.h"
#include "ktest/rng/xoroshiro.h"
#include "ktest/runtime/harness.h"
#include "ktest/validate/reference_validator.h"
#include "ktest/workload/descriptor.h"

#ifndef KTEST_WITH_CUDA
#  error "KTEST_WITH_CUDA must be defined (0/1)"
#endif

#ifndef KTEST_KERNEL_PTX_DIR
#  define KTEST_KERNEL_PTX_DIR ""
#endif

using ktest::core::HarnessConfig;
using ktest::runtime::DispatchHarness;
using ktest::runtime::ProgramSource;
using ktest::validate::Tolerance;
using ktest::workload::WorkloadBuilder;

using namespace std::chrono_literals;

namespace {

constexpr std::uint64_t kInvocations = 640000;
constexpr std::size_t kWords = ktest::rng::kXoroshiro128PlusWords;

bool have_device() {
  return KTEST_WITH_CUDA && ktest::cuda::device_count() > 0;
}

std::unique_ptr<DispatchHarness> make_harness() {
  HarnessConfig cfg;
  return std::make_unique<DispatchHarness>(ktest::cuda::make_cuda_accelerator(cfg), cfg);
}

ProgramSource ptx(const std::string& name) {
  ProgramSource src;
  src.path = std::string(KTEST_KERNEL_PTX_DIR) + "/" + name + ".ptx";
  src.entry_point = name + "_main";
  src.local_size = {64, 1, 1};
  return src;
}

} // namespace

TEST(CudaKernelsTest, MissingBackendIsDeviceError) {
  if (KTEST_WITH_CUDA) GTEST_SKIP() << "built with CUDA";
  try {
    (void)ktest::cuda::make_cuda_accelerator(HarnessConfig{});
    FAIL() << "expected ktest::Error";
  } catch (const ktest::Error& e) {
    EXPECT_EQ(e.kind(), ktest::ErrorKind::Device);
  }
}

TEST(CudaKernelsTest, OutOfRangeDeviceIsDeviceError) {
  if (!have_device()) GTEST_SKIP() << "no CUDA device";
  HarnessConfig cfg;
  cfg.device_index = ktest::cuda::device_count();
  try {
    (void)ktest::cuda::make_cuda_accelerator(cfg);
    FAIL() << "expected ktest::Error";
  } catch (const ktest::Error& e) {
    EXPECT_EQ(e.kind(), ktest::ErrorKind::Device);
    EXPECT_EQ(e.phase(), ktest::Phase::Allocate);
  }
}

TEST(CudaKernelsTest, ElementwiseExample) {
  if (!have_device()) GTEST_SKIP() << "no CUDA device";
  constexpr std::uint32_t n = 64 * 1024;
  auto h = make_harness();
  const auto desc = WorkloadBuilder()
                        .buffer<std::uint32_t>("data", n)
                        .buffer<std::uint32_t>("result", n)
                        .extent(n / 64)
                        .build();
  auto wl = h->allocate(desc, h->load_program(ptx("example")));
  {
    auto data = h->acquire_write<std::uint32_t>(wl->buffer("data"), 1s);
    for (std::uint32_t i = 0; i < n; ++i) data[i] = 0xFFFF0000u + i;
  }
  h->run(*wl, 10s);

  auto result = h->acquire_read<std::uint32_t>(wl->buffer("result"), 1s);
  const auto report = ktest::validate::check<std::uint32_t>(
      result.span(), wl->total_invocations(), [](std::uint64_t i) {
        return static_cast<std::uint32_t>(0xFFFF0000u + i) * static_cast<std::uint32_t>(i);
      });
  EXPECT_TRUE(report.ok()) << report.message();
}

TEST(CudaKernelsTest, PushConstantsLinearFunction) {
  if (!have_device()) GTEST_SKIP() << "no CUDA device";
  constexpr float a = 4.0f;
  constexpr float b = 10.0f;
  auto h = make_harness();
  const auto desc = WorkloadBuilder()
                        .buffer<float>("result", kInvocations)
                        .constant("a", a)
                        .constant("b", b)
                        .extent(100, 100, 1)
                        .build();
  auto wl = h->allocate(desc, h->load_program(ptx("push_constants")));
  h->run(*wl, 10s);

  auto result = h->acquire_read<float>(wl->buffer("result"), 1s);
  const auto report = ktest::validate::check<float>(
      result.span(), wl->total_invocations(),
      [&](std::uint64_t i) { return a * static_cast<float>(i) + b; },
      Tolerance::absolute_only(1e-4));
  EXPECT_TRUE(report.ok()) << report.message();
}

TEST(CudaKernelsTest, XoroshiroLockstep) {
  if (!have_device()) GTEST_SKIP() << "no CUDA device";
  auto h = make_harness();
  const auto desc = WorkloadBuilder()
                        .buffer<std::uint64_t>("prng", kInvocations * kWords)
                        .buffer<std::uint64_t>("result", kInvocations)
                        .extent(100, 100, 1)
                        .build();
  auto wl = h->allocate(desc, h->load_program(ptx("random")));

  ktest::rng::SeedStream seeds(20260101);
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
}
