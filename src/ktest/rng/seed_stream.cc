// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/rng/seed_stream.h"

#include "ktest/rng/philox.h"

namespace ktest {
namespace rng {

std::uint64_t SeedStream::next_u64() noexcept {
  // One Philox block yields two u64 words.
  const std::uint64_t lane = position_ & 1ull;
  if (lane == 0) {
    std::uint32_t key[2];
    std::uint32_t ctr[4];
    seed_to_key(seed_, key);
    block_to_counter(position_ >> 1, ctr);
    philox10(ctr, key, block_);
  }
  ++position_;
  return lane == 0 ? pack_u64(block_[0], block_[1]) : pack_u64(block_[2], block_[3]);
}

} // namespace rng
} // namespace ktest
