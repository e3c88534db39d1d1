// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/cuda/device.h"

#include "ktest/logging/logging.h"

#ifndef KTEST_WITH_CUDA
#  error "KTEST_WITH_CUDA must be defined (0/1)"
#endif
static_assert(KTEST_WITH_CUDA == 0 || KTEST_WITH_CUDA == 1, "KTEST_WITH_CUDA must be 0 or 1");

#if KTEST_WITH_CUDA
#  include <cuda.h>
#  include <absl/base/config.h>
#  ifdef ABSL_HAVE_LEAK_SANITIZER
extern "C" void __lsan_disable();
extern "C" void __lsan_enable();

struct LsanDisableGuard {
  LsanDisableGuard() { __lsan_disable(); }
  ~LsanDisableGuard() { __lsan_enable(); }
};
#  endif
#endif

namespace ktest {
namespace cuda {

int device_count() noexcept {
#if KTEST_WITH_CUDA
  // The CUDA driver keeps internal allocations alive for the life of the
  // process; guard this call with LeakSanitizer disable/enable when available.
#  ifdef ABSL_HAVE_LEAK_SANITIZER
  LsanDisableGuard lsan_guard;
#  endif

  // A missing driver or device is "no accelerator", not an error; callers
  // such as the CUDA kernel tests skip on 0.
  CUresult r = cuInit(0);
  if (r != CUDA_SUCCESS) {
    KTEST_VLOG(1) << "cuInit failed (" << static_cast<int>(r) << "); reporting 0 devices";
    return 0;
  }
  int count = 0;
  r = cuDeviceGetCount(&count);
  if (r != CUDA_SUCCESS) {
    KTEST_VLOG(1) << "cuDeviceGetCount failed (" << static_cast<int>(r) << "); reporting 0 devices";
    return 0;
  }
  return count < 0 ? 0 : count;
#else
  return 0;
#endif
}

} // namespace cuda
} // namespace ktest
