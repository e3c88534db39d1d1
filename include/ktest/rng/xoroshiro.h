// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace ktest {
namespace rng {

// Number of 64-bit state words of one xoroshiro128+ stream.
inline constexpr int kXoroshiro128PlusWords = 2;

inline std::uint64_t rotl64(std::uint64_t x, int k) {
  return (x << k) | (x >> (64 - k));
}

// xoroshiro128+ (55/14/36): returns s[0] + s[1] and advances `s` once.
// Host replica only. The device fixture in tests/kernels/common carries its
// own copy so that lock-step checks compare two independent implementations.
// Reference: http://xoroshiro.di.unimi.it/xoroshiro128plus.c
inline std::uint64_t xoroshiro128plus_next(std::uint64_t s[2]) {
  const std::uint64_t s0 = s[0];
  std::uint64_t s1 = s[1];
  const std::uint64_t result = s0 + s1;

  s1 ^= s0;
  s[0] = rotl64(s0, 55) ^ s1 ^ (s1 << 14);
  s[1] = rotl64(s1, 36);
  return result;
}

} // namespace rng
} // namespace ktest
