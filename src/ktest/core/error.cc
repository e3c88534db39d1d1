// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/core/error.h"

#include <absl/strings/str_cat.h>

namespace ktest {

const char* to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Configuration: return "ConfigurationError";
    case ErrorKind::Io: return "IOError";
    case ErrorKind::Device: return "DeviceError";
    case ErrorKind::Timeout: return "TimeoutError";
    case ErrorKind::Lost: return "Lost";
    case ErrorKind::Validation: return "ValidationError";
  }
  return "UnknownError";
}

const char* to_string(Phase phase) noexcept {
  switch (phase) {
    case Phase::Compose: return "compose";
    case Phase::Describe: return "describe";
    case Phase::Allocate: return "allocate";
    case Phase::Submit: return "submit";
    case Phase::Wait: return "wait";
    case Phase::Access: return "access";
    case Phase::Validate: return "validate";
  }
  return "unknown";
}

void throw_error(ErrorKind kind, Phase phase, std::string_view message) {
  throw Error(kind, phase, absl::StrCat(to_string(kind), " [", to_string(phase), "]: ", message));
}

} // namespace ktest
