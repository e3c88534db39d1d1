// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace ktest {
namespace core {

// Element type of a workload binding or constant (append-only for ABI stability)
enum class ScalarType : uint8_t {
  Int32,
  UInt32,
  Int64,
  UInt64,
  Float32,
  Float64,
};

// ABI pinning: keep ordinals stable (append-only).
static_assert(static_cast<uint8_t>(ScalarType::Int32) == 0);
static_assert(static_cast<uint8_t>(ScalarType::UInt32) == 1);
static_assert(static_cast<uint8_t>(ScalarType::Int64) == 2);
static_assert(static_cast<uint8_t>(ScalarType::UInt64) == 3);
static_assert(static_cast<uint8_t>(ScalarType::Float32) == 4);
static_assert(static_cast<uint8_t>(ScalarType::Float64) == 5);

inline constexpr std::size_t itemsize(ScalarType t) {
  switch (t) {
    case ScalarType::Int32: return 4;
    case ScalarType::UInt32: return 4;
    case ScalarType::Int64: return 8;
    case ScalarType::UInt64: return 8;
    case ScalarType::Float32: return 4;
    case ScalarType::Float64: return 8;
  }
  return 0;
}

inline constexpr bool is_floating(ScalarType t) {
  return t == ScalarType::Float32 || t == ScalarType::Float64;
}

inline constexpr const char* to_string(ScalarType t) {
  switch (t) {
    case ScalarType::Int32: return "int32";
    case ScalarType::UInt32: return "uint32";
    case ScalarType::Int64: return "int64";
    case ScalarType::UInt64: return "uint64";
    case ScalarType::Float32: return "float32";
    case ScalarType::Float64: return "float64";
  }
  return "undefined";
}

template <typename T>
struct scalar_type_traits;

template <> struct scalar_type_traits<std::int32_t> { static constexpr ScalarType value = ScalarType::Int32; };
template <> struct scalar_type_traits<std::uint32_t> { static constexpr ScalarType value = ScalarType::UInt32; };
template <> struct scalar_type_traits<std::int64_t> { static constexpr ScalarType value = ScalarType::Int64; };
template <> struct scalar_type_traits<std::uint64_t> { static constexpr ScalarType value = ScalarType::UInt64; };
template <> struct scalar_type_traits<float> { static constexpr ScalarType value = ScalarType::Float32; };
template <> struct scalar_type_traits<double> { static constexpr ScalarType value = ScalarType::Float64; };

template <typename T>
inline constexpr ScalarType scalar_type_of = scalar_type_traits<std::remove_cv_t<T>>::value;

} // namespace core
} // namespace ktest
