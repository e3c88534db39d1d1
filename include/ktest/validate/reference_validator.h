// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "ktest/core/checked_math.h"

namespace ktest {
namespace validate {

// Floating-point acceptance: |device - host| <= absolute + relative * |host|.
// Integer types always compare exactly.
struct Tolerance {
  double absolute{1e-6};
  double relative{1e-6};

  static Tolerance absolute_only(double eps) noexcept { return Tolerance{eps, 0.0}; }
};

struct Mismatch {
  std::uint64_t index{0};
  std::string   field;         // "value", "length", "state[k]" or "output"
  std::string   device_value;
  std::string   host_value;
};

struct CheckReport {
  std::uint64_t           compared{0};  // indices fully compared before stopping
  std::optional<Mismatch> mismatch;

  bool ok() const noexcept { return !mismatch.has_value(); }
  std::string message() const;
};

// Throws ktest::Error (ErrorKind::Validation, Phase::Validate) when the
// report carries a mismatch.
void require_ok(const CheckReport& report);

namespace detail {

bool within_tolerance(double device, double host, const Tolerance& tol) noexcept;

template <typename T>
std::string format_value(T v) {
  if constexpr (std::is_floating_point_v<T>) {
    return absl::StrFormat("%.*g", std::numeric_limits<T>::max_digits10, static_cast<double>(v));
  } else {
    return absl::StrCat(v);
  }
}

template <typename T>
bool values_match(T device, T host, const Tolerance& tol) noexcept {
  if constexpr (std::is_floating_point_v<T>) {
    return within_tolerance(static_cast<double>(device), static_cast<double>(host), tol);
  } else {
    return device == host;
  }
}

inline CheckReport length_mismatch(std::size_t device_len, std::uint64_t expected,
                                   std::string field) {
  CheckReport r;
  r.mismatch = Mismatch{0, std::move(field), absl::StrCat(device_len), absl::StrCat(expected)};
  return r;
}

} // namespace detail

// Compares device_output[i] with reference(i) for every i in
// [0, total_invocations), ascending, stopping at the first mismatch.
template <typename T, typename Reference>
CheckReport check(std::span<const T> device_output, std::uint64_t total_invocations,
                  Reference&& reference, const Tolerance& tol = Tolerance{}) {
  if (device_output.size() != total_invocations) {
    return detail::length_mismatch(device_output.size(), total_invocations, "length");
  }
  CheckReport report;
  for (std::uint64_t i = 0; i < total_invocations; ++i) {
    const T host = static_cast<T>(reference(i));
    const T device = device_output[i];
    if (!detail::values_match(device, host, tol)) {
      report.mismatch = Mismatch{i, "value", detail::format_value(device), detail::format_value(host)};
      return report;
    }
    ++report.compared;
  }
  return report;
}

// Lock-step replay of a seeded generator. For each invocation index in
// ascending order the host draws kWords seed words from `next_seed`, advances
// its replica once with `advance(state)`, then compares every state word with
// device_state[i*kWords + k] followed by the output with device_output[i].
// Both the state and the output must agree, not just the output.
template <typename Word, std::size_t kWords, typename Output, typename SeedSource,
          typename Advance>
CheckReport check_lockstep(std::span<const Word> device_state,
                           std::span<const Output> device_output,
                           std::uint64_t total_invocations,
                           SeedSource&& next_seed,
                           Advance&& advance) {
  static_assert(kWords > 0, "generator state needs at least one word");
  std::uint64_t state_words = 0;
  if (!core::checked_mul_u64(total_invocations, kWords, state_words)) {
    CheckReport r;
    r.mismatch = Mismatch{0, "state length", absl::StrCat(device_state.size()),
                          absl::StrCat(total_invocations, " x ", kWords, " (overflows u64)")};
    return r;
  }
  if (device_state.size() != state_words) {
    return detail::length_mismatch(device_state.size(), state_words, "state length");
  }
  if (device_output.size() != total_invocations) {
    return detail::length_mismatch(device_output.size(), total_invocations, "output length");
  }

  CheckReport report;
  for (std::uint64_t i = 0; i < total_invocations; ++i) {
    std::array<Word, kWords> state;
    for (auto& w : state) w = static_cast<Word>(next_seed());
    const Output host = static_cast<Output>(advance(state));

    for (std::size_t k = 0; k < kWords; ++k) {
      const Word device = device_state[i * kWords + k];
      if (device != state[k]) {
        report.mismatch = Mismatch{i, absl::StrCat("state[", k, "]"),
                                   detail::format_value(device), detail::format_value(state[k])};
        return report;
      }
    }
    if (device_output[i] != host) {
      report.mismatch = Mismatch{i, "output", detail::format_value(device_output[i]),
                                 detail::format_value(host)};
      return report;
    }
    ++report.compared;
  }
  return report;
}

} // namespace validate
} // namespace ktest
