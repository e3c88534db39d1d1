// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ktest/core/config.h"
#include "ktest/core/dtype.h"
#include "ktest/runtime/accelerator.h"
#include "ktest/workload/descriptor.h"

namespace ktest {
namespace runtime {

using core::ScalarType;
using workload::WorkloadDescriptor;

// Unsubmitted -> Submitted -> {Completed | TimedOut | Lost}
enum class WorkloadState : std::uint8_t {
  Unsubmitted,
  Submitted,
  Completed,
  TimedOut,
  Lost,
};

enum class BufferOwner : std::uint8_t {
  Host,
  Device,
  Indeterminate,  // after TimedOut/Lost; never accessible again
};

const char* to_string(WorkloadState s) noexcept;
const char* to_string(BufferOwner o) noexcept;

inline bool is_terminal(WorkloadState s) noexcept {
  return s == WorkloadState::Completed || s == WorkloadState::TimedOut ||
         s == WorkloadState::Lost;
}

class Workload;
class WorkloadBuffer;
class DispatchHarness;

// Throws ErrorKind::Configuration when the requested element type does not
// match the binding type.
void check_view_type(const WorkloadBuffer& buffer, ScalarType requested);

namespace detail {

struct HarnessCore;
struct Submission;

enum class AccessMode : std::uint8_t { Read, Write };

// Exclusive host borrow of one buffer; released on destruction.
class ViewLease {
 public:
  ViewLease(WorkloadBuffer& buffer, AccessMode mode,
            std::chrono::milliseconds timeout);
  ViewLease(ViewLease&& other) noexcept : buffer_(other.buffer_) { other.buffer_ = nullptr; }
  ViewLease& operator=(ViewLease&&) = delete;
  ViewLease(const ViewLease&) = delete;
  ViewLease& operator=(const ViewLease&) = delete;
  ~ViewLease() noexcept;

  void* host() const noexcept;

 private:
  WorkloadBuffer* buffer_;
};

template <typename T>
WorkloadBuffer& typed(WorkloadBuffer& buffer) {
  check_view_type(buffer, core::scalar_type_of<T>);
  return buffer;
}

} // namespace detail

// A named, typed, fixed-length host-visible region. Owned by the host or the
// device, never both; the host may only touch it through a view.
class WorkloadBuffer {
 public:
  WorkloadBuffer(const WorkloadBuffer&) = delete;
  WorkloadBuffer& operator=(const WorkloadBuffer&) = delete;

  const std::string& name() const noexcept { return name_; }
  ScalarType type() const noexcept { return type_; }
  std::size_t count() const noexcept { return count_; }
  std::size_t nbytes() const noexcept { return alloc_.nbytes; }
  BufferOwner owner() const;
  Workload& workload() const noexcept { return *workload_; }

 private:
  friend class Workload;
  friend class DispatchHarness;
  friend class detail::ViewLease;

  WorkloadBuffer(Workload* workload, const workload::BindingSpec& spec, HostAllocation alloc)
      : workload_(workload), name_(spec.name), type_(spec.type), count_(spec.count), alloc_(alloc) {}

  Workload*      workload_;
  std::string    name_;
  ScalarType     type_;
  std::size_t    count_;
  HostAllocation alloc_;
  // Guarded by workload_->mu_.
  BufferOwner    owner_{BufferOwner::Host};
  bool           borrowed_{false};
};

// Read-only host view; requires the owning workload to be Completed.
template <typename T>
class HostReadView {
 public:
  HostReadView(WorkloadBuffer& buffer, std::chrono::milliseconds timeout)
      : lease_(detail::typed<T>(buffer), detail::AccessMode::Read, timeout),
        data_(static_cast<const T*>(lease_.host()), buffer.count()) {}

  std::span<const T> span() const noexcept { return data_; }
  const T* data() const noexcept { return data_.data(); }
  std::size_t size() const noexcept { return data_.size(); }
  const T& operator[](std::size_t i) const noexcept { return data_[i]; }
  auto begin() const noexcept { return data_.begin(); }
  auto end() const noexcept { return data_.end(); }

 private:
  detail::ViewLease  lease_;
  std::span<const T> data_;
};

// Mutable host view; requires Unsubmitted or Completed.
template <typename T>
class HostWriteView {
 public:
  HostWriteView(WorkloadBuffer& buffer, std::chrono::milliseconds timeout)
      : lease_(detail::typed<T>(buffer), detail::AccessMode::Write, timeout),
        data_(static_cast<T*>(lease_.host()), buffer.count()) {}

  std::span<T> span() const noexcept { return data_; }
  T* data() const noexcept { return data_.data(); }
  std::size_t size() const noexcept { return data_.size(); }
  T& operator[](std::size_t i) const noexcept { return data_[i]; }
  auto begin() const noexcept { return data_.begin(); }
  auto end() const noexcept { return data_.end(); }

 private:
  detail::ViewLease lease_;
  std::span<T>      data_;
};

// Buffers, constants and extents of one dispatch, plus the program that runs
// it. Not copyable or movable: buffers refer back to their workload.
class Workload {
 public:
  Workload(const Workload&) = delete;
  Workload& operator=(const Workload&) = delete;
  ~Workload() noexcept;

  const WorkloadDescriptor& descriptor() const noexcept { return descriptor_; }
  const Program& program() const noexcept { return *program_; }
  WorkloadState state() const;

  // Unknown names throw ErrorKind::Configuration.
  WorkloadBuffer& buffer(std::string_view name);
  WorkloadBuffer& buffer(std::size_t index);
  std::size_t buffer_count() const noexcept { return buffers_.size(); }

  std::uint64_t total_invocations() const;

 private:
  friend class DispatchHarness;
  friend class detail::ViewLease;
  friend class WorkloadBuffer;

  Workload(std::shared_ptr<detail::HarnessCore> core,
           WorkloadDescriptor descriptor,
           std::shared_ptr<const Program> program);

  std::shared_ptr<detail::HarnessCore>         core_;
  WorkloadDescriptor                           descriptor_;
  std::shared_ptr<const Program>               program_;
  std::vector<std::unique_ptr<WorkloadBuffer>> buffers_;
  std::shared_ptr<detail::Submission>          submission_;

  mutable std::mutex      mu_;
  std::condition_variable cv_;
  WorkloadState           state_{WorkloadState::Unsubmitted};
  bool                    submit_failed_{false};
};

// Single-use token for one submission. Move-only; consumed by the first
// DispatchHarness::wait regardless of outcome.
class ExecutionHandle {
 public:
  ExecutionHandle() = default;
  ExecutionHandle(ExecutionHandle&&) noexcept = default;
  ExecutionHandle& operator=(ExecutionHandle&&) noexcept = default;
  ExecutionHandle(const ExecutionHandle&) = delete;
  ExecutionHandle& operator=(const ExecutionHandle&) = delete;
  ~ExecutionHandle() = default;

  std::uint64_t id() const noexcept { return id_; }
  bool consumed() const noexcept { return consumed_; }

 private:
  friend class DispatchHarness;

  std::shared_ptr<detail::Submission> submission_;
  std::uint64_t                       id_{0};
  bool                                consumed_{false};
};

// Allocates workloads on one accelerator, hands buffers between host and
// device, and blocks for completion. One workload is in flight at a time.
//
// Typical use:
//   DispatchHarness h(make_cuda_accelerator(cfg), cfg);
//   auto program = h.load_program(source);
//   auto wl = h.allocate(desc, program);
//   { auto in = h.acquire_write<float>(wl->buffer("data")); fill(in.span()); }
//   auto handle = h.submit(*wl);
//   h.wait(handle, std::chrono::seconds(1));
//   auto out = h.acquire_read<float>(wl->buffer("result"));
class DispatchHarness {
 public:
  explicit DispatchHarness(std::unique_ptr<Accelerator> accelerator,
                           core::HarnessConfig config = core::HarnessConfig::from_env());
  DispatchHarness(const DispatchHarness&) = delete;
  DispatchHarness& operator=(const DispatchHarness&) = delete;
  ~DispatchHarness();

  const core::HarnessConfig& config() const noexcept;
  std::string accelerator_name() const;

  std::shared_ptr<const Program> load_program(const ProgramSource& source);

  // One host-owned, uninitialized buffer per binding; state Unsubmitted.
  std::unique_ptr<Workload> allocate(const WorkloadDescriptor& descriptor,
                                     std::shared_ptr<const Program> program);

  // Unsubmitted -> Submitted; transfers every buffer to the device.
  ExecutionHandle submit(Workload& workload);

  // Blocks until completion or timeout. Completed hands buffers back to the
  // host; TimedOut and Lost make them permanently inaccessible and throw
  // ErrorKind::Timeout / ErrorKind::Lost.
  void wait(ExecutionHandle& handle, std::chrono::milliseconds timeout);
  void wait(ExecutionHandle& handle);

  // submit + wait.
  void run(Workload& workload, std::chrono::milliseconds timeout);

  template <typename T>
  HostReadView<T> acquire_read(WorkloadBuffer& buffer, std::chrono::milliseconds timeout) {
    check_same_harness(buffer);
    return HostReadView<T>(buffer, timeout);
  }
  template <typename T>
  HostReadView<T> acquire_read(WorkloadBuffer& buffer) {
    return acquire_read<T>(buffer, default_timeout());
  }

  template <typename T>
  HostWriteView<T> acquire_write(WorkloadBuffer& buffer, std::chrono::milliseconds timeout) {
    check_same_harness(buffer);
    return HostWriteView<T>(buffer, timeout);
  }
  template <typename T>
  HostWriteView<T> acquire_write(WorkloadBuffer& buffer) {
    return acquire_write<T>(buffer, default_timeout());
  }

  // Allocations held back from TimedOut/Lost workloads.
  std::size_t quarantined_allocations() const;

  // config().default_timeout_ms, clamped to the range of milliseconds.
  std::chrono::milliseconds default_timeout() const noexcept;

 private:
  void check_same_harness(const WorkloadBuffer& buffer) const;

  std::shared_ptr<detail::HarnessCore> core_;
};

} // namespace runtime
} // namespace ktest
