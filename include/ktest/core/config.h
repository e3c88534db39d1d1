// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ktest {
namespace core {

// Harness tunables. Parsed from KTEST_HARNESS_CONF, e.g.
//   KTEST_HARNESS_CONF="device=1,poll_us=20,timeout_ms=500,poison=1,log_level=2"
struct HarnessConfig {
  int           device_index{0};
  std::uint32_t poll_interval_us{50};
  std::uint64_t default_timeout_ms{10000};
  bool          poison_allocations{false};
  std::optional<int> log_level;

  static HarnessConfig parse(std::string_view conf);
  static HarnessConfig from_env();
};

// Byte written to every fresh allocation when poison_allocations is set.
inline constexpr unsigned char kPoisonByte = 0xA5;

} // namespace core
} // namespace ktest
