// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace ktest {
namespace cuda {

// Return number of CUDA devices detected.
// Semantics: when built without CUDA support or on error, returns 0.
int device_count() noexcept;

} // namespace cuda
} // namespace ktest
