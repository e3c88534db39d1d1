// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace ktest {
namespace rng {

// Deterministic stream of 64-bit seed words backed by Philox4x32-10 in
// counter mode. Copying a stream forks it: the copy replays exactly the
// words the original produces from the same point, which is how the host
// replica reproduces the seeds written into a device seed buffer.
class SeedStream {
 public:
  explicit SeedStream(std::uint64_t seed = 0) noexcept : seed_(seed) {}

  std::uint64_t next_u64() noexcept;

  std::uint64_t seed() const noexcept { return seed_; }
  // Words produced so far.
  std::uint64_t position() const noexcept { return position_; }

 private:
  std::uint64_t seed_{0};
  std::uint64_t position_{0};
  std::uint32_t block_[4]{0, 0, 0, 0};
};

} // namespace rng
} // namespace ktest
