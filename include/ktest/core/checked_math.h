// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <limits>

namespace ktest {
namespace core {

[[nodiscard]] inline bool checked_add_u64(uint64_t a, uint64_t b, uint64_t& out) noexcept {
  if (a > (std::numeric_limits<uint64_t>::max() - b)) return false;
  out = a + b;
  return true;
}

[[nodiscard]] inline bool checked_mul_u64(uint64_t a, uint64_t b, uint64_t& out) noexcept {
  // Fast paths
  if (a == 0 || b == 0) { out = 0; return true; }
  if (a == 1) { out = b; return true; }
  if (b == 1) { out = a; return true; }
  if (a > std::numeric_limits<uint64_t>::max() / b) return false;
  out = a * b;
  return true;
}

// Round `v` up to a multiple of `align` (power of two).
[[nodiscard]] inline bool checked_align_up_u64(uint64_t v, uint64_t align, uint64_t& out) noexcept {
  if (align == 0 || (align & (align - 1)) != 0) return false;
  uint64_t tmp = 0;
  if (!checked_add_u64(v, align - 1, tmp)) return false;
  out = tmp & ~(align - 1);
  return true;
}

} // namespace core
} // namespace ktest
