// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/cuda/accelerator.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <new>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>

#include "ktest/core/error.h"
#include "ktest/logging/logging.h"

#ifndef KTEST_WITH_CUDA
#  error "KTEST_WITH_CUDA must be defined (0/1)"
#endif
static_assert(KTEST_WITH_CUDA == 0 || KTEST_WITH_CUDA == 1, "KTEST_WITH_CUDA must be 0 or 1");

#if KTEST_WITH_CUDA
#  include <cuda.h>
#endif

namespace ktest {
namespace cuda {

#if KTEST_WITH_CUDA

namespace {

using runtime::Clock;
using runtime::Extent3;
using runtime::FenceStatus;
using runtime::HostAllocation;
using runtime::LaunchParams;
using runtime::ProgramSource;

std::string cu_error_string(CUresult r) {
  const char* err = nullptr;
  (void)cuGetErrorString(r, &err);
  return err ? std::string(err) : absl::StrCat("CUresult ", static_cast<int>(r));
}

inline void cuCheck(CUresult r, const char* what, Phase phase) {
  if (r != CUDA_SUCCESS) {
    throw_error(ErrorKind::Device, phase, absl::StrCat(what, " failed: ", cu_error_string(r)));
  }
}

// Retained primary context of one device.
class CudaContext {
 public:
  explicit CudaContext(int device_index) {
    cuCheck(cuInit(0), "cuInit", Phase::Allocate);
    int count = 0;
    cuCheck(cuDeviceGetCount(&count), "cuDeviceGetCount", Phase::Allocate);
    if (device_index < 0 || device_index >= count) {
      throw_error(ErrorKind::Device, Phase::Allocate,
                  absl::StrCat("no compatible accelerator: device ", device_index,
                               " requested, ", count, " available"));
    }
    cuCheck(cuDeviceGet(&device_, device_index), "cuDeviceGet", Phase::Allocate);

    int can_map = 0;
    cuCheck(cuDeviceGetAttribute(&can_map, CU_DEVICE_ATTRIBUTE_CAN_MAP_HOST_MEMORY, device_),
            "cuDeviceGetAttribute", Phase::Allocate);
    if (!can_map) {
      throw_error(ErrorKind::Device, Phase::Allocate,
                  absl::StrCat("no compatible accelerator: device ", device_index,
                               " cannot map host memory"));
    }

    cuCheck(cuDevicePrimaryCtxRetain(&context_, device_), "cuDevicePrimaryCtxRetain",
            Phase::Allocate);
    char name[256] = {0};
    if (cuDeviceGetName(name, sizeof(name) - 1, device_) == CUDA_SUCCESS) {
      name_ = name;
    }
    index_ = device_index;
  }

  CudaContext(const CudaContext&) = delete;
  CudaContext& operator=(const CudaContext&) = delete;

  ~CudaContext() {
    (void)cuDevicePrimaryCtxRelease(device_);
  }

  CUcontext get() const noexcept { return context_; }
  int index() const noexcept { return index_; }
  const std::string& name() const noexcept { return name_; }

 private:
  CUdevice    device_{0};
  CUcontext   context_{nullptr};
  int         index_{-1};
  std::string name_;
};

// RAII guard that makes a context current on construction and restores the
// previous one on destruction.
class ContextGuard final {
 public:
  explicit ContextGuard(const CudaContext& ctx) noexcept {
    pushed_ = cuCtxPushCurrent(ctx.get()) == CUDA_SUCCESS;
  }
  ~ContextGuard() noexcept {
    if (pushed_) {
      CUcontext popped = nullptr;
      (void)cuCtxPopCurrent(&popped);
    }
  }

  ContextGuard(const ContextGuard&) = delete;
  ContextGuard& operator=(const ContextGuard&) = delete;

 private:
  bool pushed_{false};
};

class CudaProgram final : public runtime::Program {
 public:
  CudaProgram(std::shared_ptr<CudaContext> ctx, const ProgramSource& source)
      : ctx_(std::move(ctx)), entry_point_(source.entry_point), local_size_(source.local_size) {
    ContextGuard g(*ctx_);
    if (!source.image.empty()) {
      std::vector<char> image = source.image;
      image.push_back('\0');  // PTX images must be NUL-terminated
      cuCheck(cuModuleLoadData(&module_, image.data()), "cuModuleLoadData", Phase::Allocate);
    } else {
      cuCheck(cuModuleLoad(&module_, source.path.c_str()),
              absl::StrCat("cuModuleLoad(", source.path, ")").c_str(), Phase::Allocate);
    }
    CUresult r = cuModuleGetFunction(&function_, module_, entry_point_.c_str());
    if (r != CUDA_SUCCESS) {
      (void)cuModuleUnload(module_);
      throw_error(ErrorKind::Device, Phase::Allocate,
                  absl::StrCat("cuModuleGetFunction(", entry_point_, ") failed: ",
                               cu_error_string(r)));
    }
    int max_threads = 0;
    r = cuFuncGetAttribute(&max_threads, CU_FUNC_ATTRIBUTE_MAX_THREADS_PER_BLOCK, function_);
    if (r == CUDA_SUCCESS && invocations_per_group() > static_cast<std::uint64_t>(max_threads)) {
      (void)cuModuleUnload(module_);
      throw_error(ErrorKind::Device, Phase::Allocate,
                  absl::StrCat("'", entry_point_, "' supports at most ", max_threads,
                               " invocations per group, local size declares ",
                               invocations_per_group()));
    }
  }

  ~CudaProgram() override {
    ContextGuard g(*ctx_);
    (void)cuModuleUnload(module_);
  }

  const std::string& entry_point() const noexcept override { return entry_point_; }
  Extent3 local_size() const noexcept override { return local_size_; }
  CUfunction function() const noexcept { return function_; }

 private:
  std::shared_ptr<CudaContext> ctx_;
  std::string entry_point_;
  Extent3     local_size_;
  CUmodule    module_{nullptr};
  CUfunction  function_{nullptr};
};

class CudaFence final : public runtime::Fence {
 public:
  CudaFence(std::shared_ptr<CudaContext> ctx, CUevent event, std::chrono::microseconds poll)
      : ctx_(std::move(ctx)), event_(event), poll_(poll) {}

  ~CudaFence() override {
    ContextGuard g(*ctx_);
    (void)cuEventDestroy(event_);
  }

  FenceStatus wait_until(Clock::time_point deadline) override {
    ContextGuard g(*ctx_);
    while (true) {
      const CUresult st = cuEventQuery(event_);
      if (st == CUDA_SUCCESS) return FenceStatus::Signaled;
      if (st != CUDA_ERROR_NOT_READY) {
        KTEST_LOG(ERROR) << "device " << ctx_->index() << " aborted work: " << cu_error_string(st);
        return FenceStatus::Faulted;
      }
      const auto now = Clock::now();
      if (now >= deadline) return FenceStatus::Pending;
      std::this_thread::sleep_for(std::min<Clock::duration>(poll_, deadline - now));
    }
  }

 private:
  std::shared_ptr<CudaContext> ctx_;
  CUevent                      event_;
  std::chrono::microseconds    poll_;
};

class CudaAccelerator final : public runtime::Accelerator {
 public:
  explicit CudaAccelerator(const core::HarnessConfig& config)
      : ctx_(std::make_shared<CudaContext>(config.device_index)),
        poll_(config.poll_interval_us) {
    ContextGuard g(*ctx_);
    cuCheck(cuStreamCreate(&stream_, CU_STREAM_NON_BLOCKING), "cuStreamCreate", Phase::Allocate);
  }

  ~CudaAccelerator() override {
    ContextGuard g(*ctx_);
    (void)cuStreamDestroy(stream_);
  }

  std::string name() const override {
    return absl::StrCat("cuda:", ctx_->index(), " (", ctx_->name(), ")");
  }

  HostAllocation allocate_host_visible(std::size_t nbytes) override {
    ContextGuard g(*ctx_);
    void* host = nullptr;
    cuCheck(cuMemHostAlloc(&host, nbytes, CU_MEMHOSTALLOC_DEVICEMAP | CU_MEMHOSTALLOC_PORTABLE),
            "cuMemHostAlloc", Phase::Allocate);
    CUdeviceptr dptr = 0;
    const CUresult r = cuMemHostGetDevicePointer(&dptr, host, 0);
    if (r != CUDA_SUCCESS) {
      (void)cuMemFreeHost(host);
      cuCheck(r, "cuMemHostGetDevicePointer", Phase::Allocate);
    }
    return HostAllocation{host, static_cast<std::uint64_t>(dptr), nbytes};
  }

  void free_host_visible(const HostAllocation& alloc) noexcept override {
    if (!alloc.host) return;
    ContextGuard g(*ctx_);
    (void)cuMemFreeHost(alloc.host);
  }

  std::shared_ptr<const runtime::Program> load_program(const ProgramSource& source) override {
    auto program = std::make_shared<CudaProgram>(ctx_, source);
    KTEST_LOG(INFO) << "loaded '" << source.entry_point << "' on " << name();
    return program;
  }

  std::unique_ptr<runtime::Fence> launch(const runtime::Program& program,
                                         const LaunchParams& params) override {
    const auto* cuda_program = dynamic_cast<const CudaProgram*>(&program);
    if (cuda_program == nullptr) {
      throw_error(ErrorKind::Configuration, Phase::Submit,
                  "program was not loaded by this accelerator");
    }

    // argv points into these two; both outlive cuLaunchKernel.
    std::vector<CUdeviceptr> pointers(params.buffer_addresses.begin(),
                                      params.buffer_addresses.end());
    std::vector<std::byte> constants = params.constant_block;
    std::vector<void*> argv;
    argv.reserve(pointers.size() + params.constant_slots.size());
    for (auto& p : pointers) argv.push_back(&p);
    for (const auto& slot : params.constant_slots) argv.push_back(constants.data() + slot.offset);

    const Extent3 g = params.groups;
    const Extent3 l = cuda_program->local_size();
    ContextGuard guard(*ctx_);
    // Everything that can fail without touching the stream happens first, so
    // a throw below the launch only ever follows a drained stream.
    CUevent ev = nullptr;
    cuCheck(cuEventCreate(&ev, CU_EVENT_DISABLE_TIMING), "cuEventCreate", Phase::Submit);
    std::unique_ptr<CudaFence> fence;
    try {
      fence = std::make_unique<CudaFence>(ctx_, ev, poll_);
    } catch (const std::bad_alloc&) {
      (void)cuEventDestroy(ev);
      throw;
    }

    cuCheck(cuLaunchKernel(cuda_program->function(),
                           g.x, g.y, g.z,
                           l.x, l.y, l.z,
                           /*sharedMemBytes=*/0,
                           stream_,
                           argv.empty() ? nullptr : argv.data(),
                           nullptr),
            "cuLaunchKernel", Phase::Submit);

    const CUresult r = cuEventRecord(ev, stream_);
    if (r != CUDA_SUCCESS) {
      // The kernel is queued but has no fence; drain it before the buffers
      // go back to the host.
      KTEST_LOG(ERROR) << "cuEventRecord failed after launch; draining stream on " << name();
      (void)cuStreamSynchronize(stream_);
      cuCheck(r, "cuEventRecord", Phase::Submit);
    }
    return fence;
  }

  void synchronize() noexcept override {
    ContextGuard g(*ctx_);
    (void)cuStreamSynchronize(stream_);
  }

 private:
  std::shared_ptr<CudaContext> ctx_;
  std::chrono::microseconds    poll_;
  CUstream                     stream_{nullptr};
};

} // namespace

std::unique_ptr<runtime::Accelerator> make_cuda_accelerator(const core::HarnessConfig& config) {
  return std::make_unique<CudaAccelerator>(config);
}

#else

std::unique_ptr<runtime::Accelerator> make_cuda_accelerator(const core::HarnessConfig& /*config*/) {
  throw_error(ErrorKind::Device, Phase::Allocate,
              "no compatible accelerator: built without CUDA support");
}

#endif

} // namespace cuda
} // namespace ktest
