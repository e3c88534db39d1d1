// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include "ktest/core/config.h"
#include "ktest/runtime/accelerator.h"

namespace ktest {
namespace cuda {

// CUDA driver-API accelerator on device `config.device_index`.
//
// - Buffers are mapped pinned host memory (cuMemHostAlloc + DEVICEMAP).
// - Programs are PTX or cubin images (cuModuleLoad / cuModuleLoadData).
// - Kernel parameters: one device pointer per binding in binding order,
//   then each constant by value in declaration order.
// - Completion is a CUDA event polled every `config.poll_interval_us`.
//
// Throws ktest::Error(ErrorKind::Device) when no compatible device exists or
// when built without CUDA support.
std::unique_ptr<runtime::Accelerator> make_cuda_accelerator(const core::HarnessConfig& config);

} // namespace cuda
} // namespace ktest
