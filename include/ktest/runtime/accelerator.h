// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ktest/workload/descriptor.h"

namespace ktest {
namespace runtime {

using Clock = std::chrono::steady_clock;
using workload::Extent3;

// `now + timeout`, saturated at Clock::time_point::max(). A bound such as
// milliseconds::max() means "no deadline" rather than wrapping into the past.
inline Clock::time_point deadline_after(Clock::time_point now,
                                        std::chrono::milliseconds timeout) noexcept {
  if (timeout <= std::chrono::milliseconds::zero()) return now;
  const auto headroom = Clock::time_point::max() - now;
  if (timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(headroom)) {
    return Clock::time_point::max();
  }
  return now + std::chrono::duration_cast<Clock::duration>(timeout);
}

// Where to find a compiled program and the contract it was compiled against.
// Exactly one of `path` / `image` is used; `image` wins when non-empty.
struct ProgramSource {
  std::string       path;
  std::vector<char> image;
  std::string       entry_point;
  Extent3           local_size{};  // per-group invocation extent declared by the program
};

// A program loaded into an accelerator.
class Program {
 public:
  Program() = default;
  Program(const Program&) = delete;
  Program& operator=(const Program&) = delete;
  virtual ~Program() = default;

  virtual const std::string& entry_point() const noexcept = 0;
  virtual Extent3 local_size() const noexcept = 0;

  std::uint64_t invocations_per_group() const noexcept {
    const Extent3 l = local_size();
    return static_cast<std::uint64_t>(l.x) * l.y * l.z;
  }
};

// Host-visible memory usable by the device. `device_address` is the address
// the device dereferences (equal to `host` on unified address spaces).
struct HostAllocation {
  void*         host{nullptr};
  std::uint64_t device_address{0};
  std::size_t   nbytes{0};
};

// Everything one dispatch needs. Buffer addresses follow binding order;
// constants follow declaration order, each as a slot into `constant_block`.
struct LaunchParams {
  Extent3                            groups{};
  std::vector<std::uint64_t>         buffer_addresses;
  std::vector<std::byte>             constant_block;
  std::vector<workload::ConstantSlot> constant_slots;
};

enum class FenceStatus : std::uint8_t {
  Pending,   // deadline reached before the device signaled
  Signaled,  // device finished, all writes visible to the host
  Faulted,   // device aborted the work
};

// Completion signal of one launch.
class Fence {
 public:
  Fence() = default;
  Fence(const Fence&) = delete;
  Fence& operator=(const Fence&) = delete;
  virtual ~Fence() = default;

  // Blocks until the fence leaves Pending or `deadline` passes.
  virtual FenceStatus wait_until(Clock::time_point deadline) = 0;
};

// The external accelerator runtime: device/queue context, memory, program
// loading and dispatch. One instance is owned by one DispatchHarness.
// Failures are reported as ktest::Error with ErrorKind::Device.
class Accelerator {
 public:
  Accelerator() = default;
  Accelerator(const Accelerator&) = delete;
  Accelerator& operator=(const Accelerator&) = delete;
  virtual ~Accelerator() = default;

  virtual std::string name() const = 0;

  virtual HostAllocation allocate_host_visible(std::size_t nbytes) = 0;
  virtual void free_host_visible(const HostAllocation& alloc) noexcept = 0;

  virtual std::shared_ptr<const Program> load_program(const ProgramSource& source) = 0;

  // Enqueues one dispatch; returns its completion fence. If this throws, no
  // device work from the call is outstanding and every buffer in `params`
  // may be handed back to the host.
  virtual std::unique_ptr<Fence> launch(const Program& program, const LaunchParams& params) = 0;

  // Blocks until all previously launched work has drained (or failed).
  virtual void synchronize() noexcept = 0;
};

} // namespace runtime
} // namespace ktest
