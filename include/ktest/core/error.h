// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ktest {

// What went wrong. Policy: append-only, explicit numbering.
enum class ErrorKind : std::uint8_t {
  Configuration = 0,  // invalid caller input; detected before I/O or device work
  Io = 1,             // fragment unreadable, output uncreatable
  Device = 2,         // no accelerator, allocation/launch rejected
  Timeout = 3,        // caller-supplied bound exceeded
  Lost = 4,           // accelerator aborted mid-execution
  Validation = 5,     // device results disagree with the host reference
};

// Where it went wrong. Policy: append-only, explicit numbering.
enum class Phase : std::uint8_t {
  Compose = 0,
  Describe = 1,
  Allocate = 2,
  Submit = 3,
  Wait = 4,
  Access = 5,
  Validate = 6,
};

const char* to_string(ErrorKind kind) noexcept;
const char* to_string(Phase phase) noexcept;

namespace detail {
inline constexpr std::size_t kMaxErrorWhatBytes = 1024;

inline std::string truncate_bytes(std::string s, std::size_t max) {
  if (s.size() <= max) return s;
  s.resize(max);
  return s;
}
} // namespace detail

// Every failure the library raises. All errors are terminal for the current
// run; callers rebuild inputs instead of retrying.
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, Phase phase, std::string message)
      : std::runtime_error(detail::truncate_bytes(std::move(message), detail::kMaxErrorWhatBytes)),
        kind_(kind),
        phase_(phase) {}

  ErrorKind kind() const noexcept { return kind_; }
  Phase phase() const noexcept { return phase_; }

 private:
  ErrorKind kind_;
  Phase phase_;
};

[[noreturn]] void throw_error(ErrorKind kind, Phase phase, std::string_view message);

} // namespace ktest
