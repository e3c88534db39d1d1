// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <cassert>
#include <absl/log/log.h>
#include <absl/log/check.h>

namespace ktest {
// Initialize Abseil logging once; optionally set min log level.
void InitLogging(std::optional<int> min_level);
}

#define KTEST_LOG(level) LOG(level)
#define KTEST_VLOG(n) VLOG(n)
#define KTEST_CHECK(cond) CHECK(cond)
#define KTEST_ASSERT(cond) assert(cond)
