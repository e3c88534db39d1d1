// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/runtime/harness.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include <absl/strings/str_cat.h>

#include "ktest/core/error.h"
#include "ktest/logging/logging.h"

namespace ktest {
namespace runtime {

namespace detail {

// State shared by a harness and every workload it allocated; outlives the
// harness object while workloads remain.
struct HarnessCore {
  std::unique_ptr<Accelerator> accelerator;
  core::HarnessConfig          config;

  std::mutex                  mu;
  const Workload*             in_flight{nullptr};
  std::vector<HostAllocation> quarantine;
  std::uint64_t               next_submission_id{1};

  HarnessCore(std::unique_ptr<Accelerator> a, core::HarnessConfig c)
      : accelerator(std::move(a)), config(std::move(c)) {}

  ~HarnessCore() {
    if (quarantine.empty()) return;
    // Device work touching these may still be running.
    accelerator->synchronize();
    for (const HostAllocation& alloc : quarantine) {
      accelerator->free_host_visible(alloc);
    }
    KTEST_LOG(INFO) << "released " << quarantine.size() << " quarantined allocation(s)";
  }
};

struct Submission {
  Workload*              workload{nullptr};
  std::unique_ptr<Fence> fence;
};

ViewLease::ViewLease(WorkloadBuffer& buffer, AccessMode mode,
                     std::chrono::milliseconds timeout)
    : buffer_(&buffer) {
  Workload& wl = *buffer.workload_;
  const char* what = (mode == AccessMode::Read) ? "acquire_read" : "acquire_write";

  std::unique_lock<std::mutex> lock(wl.mu_);
  auto check_state = [&]() {
    const WorkloadState s = wl.state_;
    if (s == WorkloadState::TimedOut || s == WorkloadState::Lost) {
      throw_error(ErrorKind::Configuration, Phase::Access,
                  absl::StrCat(what, "('", buffer.name_, "'): workload is ", to_string(s),
                               "; its buffers are permanently inaccessible"));
    }
    if (mode == AccessMode::Read && s == WorkloadState::Unsubmitted) {
      throw_error(ErrorKind::Configuration, Phase::Access,
                  absl::StrCat(what, "('", buffer.name_,
                               "'): results are readable only after the workload completed"));
    }
  };
  auto blocked = [&]() {
    return buffer.borrowed_ || wl.state_ == WorkloadState::Submitted;
  };

  check_state();
  const auto deadline = deadline_after(Clock::now(), timeout);
  while (blocked()) {
    if (wl.cv_.wait_until(lock, deadline) == std::cv_status::timeout && blocked()) {
      throw_error(ErrorKind::Timeout, Phase::Access,
                  absl::StrCat(what, "('", buffer.name_, "'): buffer did not settle within ",
                               timeout.count(), " ms (",
                               buffer.borrowed_ ? "another view is outstanding"
                                                : "workload is in flight",
                               ")"));
    }
    check_state();
  }
  KTEST_CHECK(buffer.owner_ == BufferOwner::Host);
  buffer.borrowed_ = true;
}

ViewLease::~ViewLease() noexcept {
  if (!buffer_) return;
  Workload& wl = *buffer_->workload_;
  {
    std::lock_guard<std::mutex> lock(wl.mu_);
    buffer_->borrowed_ = false;
  }
  wl.cv_.notify_all();
}

void* ViewLease::host() const noexcept {
  return buffer_ ? buffer_->alloc_.host : nullptr;
}

} // namespace detail

const char* to_string(WorkloadState s) noexcept {
  switch (s) {
    case WorkloadState::Unsubmitted: return "Unsubmitted";
    case WorkloadState::Submitted: return "Submitted";
    case WorkloadState::Completed: return "Completed";
    case WorkloadState::TimedOut: return "TimedOut";
    case WorkloadState::Lost: return "Lost";
  }
  return "Unknown";
}

const char* to_string(BufferOwner o) noexcept {
  switch (o) {
    case BufferOwner::Host: return "host";
    case BufferOwner::Device: return "device";
    case BufferOwner::Indeterminate: return "indeterminate";
  }
  return "unknown";
}

void check_view_type(const WorkloadBuffer& buffer, ScalarType requested) {
  if (buffer.type() != requested) {
    throw_error(ErrorKind::Configuration, Phase::Access,
                absl::StrCat("buffer '", buffer.name(), "' holds ", core::to_string(buffer.type()),
                             ", requested view of ", core::to_string(requested)));
  }
}

BufferOwner WorkloadBuffer::owner() const {
  std::lock_guard<std::mutex> lock(workload_->mu_);
  return owner_;
}

// ---- Workload ----

Workload::Workload(std::shared_ptr<detail::HarnessCore> core,
                   WorkloadDescriptor descriptor,
                   std::shared_ptr<const Program> program)
    : core_(std::move(core)),
      descriptor_(std::move(descriptor)),
      program_(std::move(program)) {}

Workload::~Workload() noexcept {
  bool unsafe = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    unsafe = state_ == WorkloadState::Submitted || state_ == WorkloadState::TimedOut ||
             state_ == WorkloadState::Lost;
  }
  std::lock_guard<std::mutex> core_lock(core_->mu);
  if (submission_) submission_->workload = nullptr;
  if (core_->in_flight == this) core_->in_flight = nullptr;
  for (const auto& b : buffers_) {
    if (unsafe) {
      core_->quarantine.push_back(b->alloc_);
    } else {
      core_->accelerator->free_host_visible(b->alloc_);
    }
  }
  if (unsafe && !buffers_.empty()) {
    KTEST_LOG(WARNING) << "quarantined " << buffers_.size()
                       << " buffer(s) of a workload that did not complete";
  }
}

WorkloadState Workload::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

WorkloadBuffer& Workload::buffer(std::string_view name) {
  return *buffers_[descriptor_.binding_index(name)];
}

WorkloadBuffer& Workload::buffer(std::size_t index) {
  if (index >= buffers_.size()) {
    throw_error(ErrorKind::Configuration, Phase::Access,
                absl::StrCat("buffer index ", index, " out of range (", buffers_.size(), " buffers)"));
  }
  return *buffers_[index];
}

std::uint64_t Workload::total_invocations() const {
  return descriptor_.total_invocations(program_->invocations_per_group());
}

// ---- DispatchHarness ----

DispatchHarness::DispatchHarness(std::unique_ptr<Accelerator> accelerator,
                                 core::HarnessConfig config) {
  if (!accelerator) {
    throw_error(ErrorKind::Device, Phase::Allocate, "no accelerator context");
  }
  InitLogging(config.log_level);
  core_ = std::make_shared<detail::HarnessCore>(std::move(accelerator), std::move(config));
  KTEST_LOG(INFO) << "dispatch harness on " << core_->accelerator->name();
}

DispatchHarness::~DispatchHarness() = default;

const core::HarnessConfig& DispatchHarness::config() const noexcept {
  return core_->config;
}

std::string DispatchHarness::accelerator_name() const {
  return core_->accelerator->name();
}

std::chrono::milliseconds DispatchHarness::default_timeout() const noexcept {
  // Set directly (not parsed), the field can exceed the duration's range.
  constexpr auto kMax = static_cast<std::uint64_t>(std::chrono::milliseconds::max().count());
  const std::uint64_t ms = std::min(core_->config.default_timeout_ms, kMax);
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
}

void DispatchHarness::check_same_harness(const WorkloadBuffer& buffer) const {
  if (buffer.workload_->core_ != core_) {
    throw_error(ErrorKind::Configuration, Phase::Access,
                absl::StrCat("buffer '", buffer.name(), "' belongs to a different harness"));
  }
}

std::shared_ptr<const Program> DispatchHarness::load_program(const ProgramSource& source) {
  if (source.entry_point.empty()) {
    throw_error(ErrorKind::Configuration, Phase::Allocate, "program entry point is empty");
  }
  if (source.path.empty() && source.image.empty()) {
    throw_error(ErrorKind::Configuration, Phase::Allocate, "program has neither a path nor an image");
  }
  const Extent3 l = source.local_size;
  if (l.x == 0 || l.y == 0 || l.z == 0) {
    throw_error(ErrorKind::Configuration, Phase::Allocate,
                absl::StrCat("program local size must be strictly positive, got [",
                             l.x, ", ", l.y, ", ", l.z, "]"));
  }
  return core_->accelerator->load_program(source);
}

std::unique_ptr<Workload> DispatchHarness::allocate(const WorkloadDescriptor& descriptor,
                                                    std::shared_ptr<const Program> program) {
  if (!program) {
    throw_error(ErrorKind::Configuration, Phase::Allocate, "allocate: program is null");
  }
  std::unique_ptr<Workload> wl(new Workload(core_, descriptor, std::move(program)));

  std::size_t total_bytes = 0;
  const auto& bindings = wl->descriptor_.bindings();
  wl->buffers_.reserve(bindings.size());
  for (std::size_t i = 0; i < bindings.size(); ++i) {
    const std::size_t nbytes = wl->descriptor_.binding_nbytes(i);
    HostAllocation alloc = core_->accelerator->allocate_host_visible(nbytes);
    // From here on the workload destructor frees it.
    wl->buffers_.push_back(std::unique_ptr<WorkloadBuffer>(
        new WorkloadBuffer(wl.get(), bindings[i], alloc)));
    if (core_->config.poison_allocations) {
      std::memset(alloc.host, core::kPoisonByte, alloc.nbytes);
    }
    total_bytes += nbytes;
  }
  KTEST_LOG(INFO) << "allocated " << wl->buffers_.size() << " buffer(s), " << total_bytes
                  << " bytes, for '" << wl->program_->entry_point() << "'";
  return wl;
}

ExecutionHandle DispatchHarness::submit(Workload& workload) {
  if (workload.core_ != core_) {
    throw_error(ErrorKind::Configuration, Phase::Submit, "workload belongs to a different harness");
  }

  std::unique_lock<std::mutex> core_lock(core_->mu);
  std::unique_lock<std::mutex> lock(workload.mu_);
  if (workload.submit_failed_) {
    throw_error(ErrorKind::Configuration, Phase::Submit,
                "an earlier submission of this workload failed; build a fresh workload");
  }
  if (workload.state_ != WorkloadState::Unsubmitted) {
    throw_error(ErrorKind::Configuration, Phase::Submit,
                absl::StrCat("workload is ", to_string(workload.state_),
                             "; workloads are submitted once"));
  }
  if (core_->in_flight != nullptr) {
    throw_error(ErrorKind::Configuration, Phase::Submit,
                "another workload of this harness is still in flight");
  }
  for (const auto& b : workload.buffers_) {
    if (b->borrowed_) {
      throw_error(ErrorKind::Configuration, Phase::Submit,
                  absl::StrCat("buffer '", b->name_, "' still has an outstanding host view"));
    }
  }

  LaunchParams params;
  params.groups = workload.descriptor_.extent();
  params.buffer_addresses.reserve(workload.buffers_.size());
  for (const auto& b : workload.buffers_) {
    params.buffer_addresses.push_back(b->alloc_.device_address);
  }
  params.constant_block = workload.descriptor_.constant_block();
  params.constant_slots = workload.descriptor_.constant_slots();

  // Host -> device.
  for (auto& b : workload.buffers_) b->owner_ = BufferOwner::Device;
  workload.state_ = WorkloadState::Submitted;

  auto submission = std::make_shared<detail::Submission>();
  submission->workload = &workload;
  try {
    submission->fence = core_->accelerator->launch(*workload.program_, params);
  } catch (...) {
    for (auto& b : workload.buffers_) b->owner_ = BufferOwner::Host;
    workload.state_ = WorkloadState::Unsubmitted;
    workload.submit_failed_ = true;
    throw;
  }

  workload.submission_ = submission;
  core_->in_flight = &workload;

  ExecutionHandle handle;
  handle.submission_ = std::move(submission);
  handle.id_ = core_->next_submission_id++;
  const Extent3 e = params.groups;
  KTEST_LOG(INFO) << "submitted #" << handle.id_ << " '" << workload.program_->entry_point()
                  << "' groups=[" << e.x << ", " << e.y << ", " << e.z << "] invocations="
                  << workload.descriptor_.total_invocations(workload.program_->invocations_per_group());
  return handle;
}

void DispatchHarness::wait(ExecutionHandle& handle, std::chrono::milliseconds timeout) {
  if (handle.consumed_ || !handle.submission_) {
    throw_error(ErrorKind::Configuration, Phase::Wait,
                "execution handle already reached a terminal state; handles are single-use");
  }
  handle.consumed_ = true;
  std::shared_ptr<detail::Submission> submission = std::move(handle.submission_);

  Workload* wl = nullptr;
  {
    std::lock_guard<std::mutex> core_lock(core_->mu);
    wl = submission->workload;
  }
  if (wl == nullptr) {
    throw_error(ErrorKind::Configuration, Phase::Wait,
                absl::StrCat("workload of submission #", handle.id_, " was destroyed"));
  }

  // The only suspension point.
  const auto start = Clock::now();
  const FenceStatus status = submission->fence->wait_until(deadline_after(start, timeout));
  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();

  WorkloadState next = WorkloadState::Completed;
  {
    std::lock_guard<std::mutex> core_lock(core_->mu);
    std::lock_guard<std::mutex> lock(wl->mu_);
    switch (status) {
      case FenceStatus::Signaled:
        next = WorkloadState::Completed;
        for (auto& b : wl->buffers_) b->owner_ = BufferOwner::Host;  // device -> host
        break;
      case FenceStatus::Pending:
        next = WorkloadState::TimedOut;
        for (auto& b : wl->buffers_) b->owner_ = BufferOwner::Indeterminate;
        break;
      case FenceStatus::Faulted:
        next = WorkloadState::Lost;
        for (auto& b : wl->buffers_) b->owner_ = BufferOwner::Indeterminate;
        break;
    }
    wl->state_ = next;
    if (core_->in_flight == wl) core_->in_flight = nullptr;
  }
  wl->cv_.notify_all();

  switch (next) {
    case WorkloadState::Completed:
      KTEST_LOG(INFO) << "submission #" << handle.id_ << " completed in " << elapsed_ms << " ms";
      return;
    case WorkloadState::TimedOut:
      KTEST_LOG(ERROR) << "submission #" << handle.id_ << " timed out after " << elapsed_ms << " ms";
      throw_error(ErrorKind::Timeout, Phase::Wait,
                  absl::StrCat("submission #", handle.id_, " did not complete within ",
                               timeout.count(), " ms; its buffers are no longer accessible"));
    default:
      KTEST_LOG(ERROR) << "submission #" << handle.id_ << " lost after " << elapsed_ms << " ms";
      throw_error(ErrorKind::Lost, Phase::Wait,
                  absl::StrCat("accelerator aborted submission #", handle.id_,
                               "; its buffers are no longer accessible"));
  }
}

void DispatchHarness::wait(ExecutionHandle& handle) {
  wait(handle, default_timeout());
}

void DispatchHarness::run(Workload& workload, std::chrono::milliseconds timeout) {
  ExecutionHandle handle = submit(workload);
  wait(handle, timeout);
}

std::size_t DispatchHarness::quarantined_allocations() const {
  std::lock_guard<std::mutex> lock(core_->mu);
  return core_->quarantine.size();
}

} // namespace runtime
} // namespace ktest
