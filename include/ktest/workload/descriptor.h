// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "ktest/core/dtype.h"

namespace ktest {
namespace workload {

using core::ScalarType;

struct Extent3 {
  std::uint32_t x{1};
  std::uint32_t y{1};
  std::uint32_t z{1};

  bool operator==(const Extent3&) const = default;
};

// One storage binding: `count` elements of `type`, addressed by `name`.
struct BindingSpec {
  std::string name;
  ScalarType  type{ScalarType::Float32};
  std::size_t count{0};
};

using ConstantValue = std::variant<std::int32_t, std::uint32_t, std::int64_t,
                                   std::uint64_t, float, double>;

ScalarType constant_type(const ConstantValue& v) noexcept;

struct ConstantSpec {
  std::string   name;
  ConstantValue value;
};

// Position of one constant inside the packed constant block.
struct ConstantSlot {
  std::size_t offset{0};
  std::size_t size{0};
};

// Validated description of a workload. Construction checks every invariant
// eagerly and throws ktest::Error (ErrorKind::Configuration, Phase::Describe)
// before anything is allocated:
//   - binding names unique and non-empty, element counts > 0
//   - constant names unique and non-empty
//   - every extent component > 0
// Immutable afterwards.
class WorkloadDescriptor {
 public:
  WorkloadDescriptor(std::vector<BindingSpec> bindings,
                     std::vector<ConstantSpec> constants,
                     Extent3 extent);

  const std::vector<BindingSpec>& bindings() const noexcept { return bindings_; }
  const std::vector<ConstantSpec>& constants() const noexcept { return constants_; }
  const Extent3& extent() const noexcept { return extent_; }

  // Name -> declaration slot. Unknown names throw ErrorKind::Configuration.
  std::size_t binding_index(std::string_view name) const;
  std::size_t constant_index(std::string_view name) const;
  bool has_binding(std::string_view name) const noexcept;

  // Byte length of a binding (count * itemsize).
  std::size_t binding_nbytes(std::size_t index) const;

  // Constants packed in declaration order at natural alignment.
  const std::vector<std::byte>& constant_block() const noexcept { return constant_block_; }
  const std::vector<ConstantSlot>& constant_slots() const noexcept { return constant_slots_; }

  // Number of workgroups: extent.x * extent.y * extent.z.
  std::uint64_t group_count() const;

  // extent.x * extent.y * extent.z * invocations_per_group. The per-group
  // figure is a contract with the compiled program and is not verified here.
  std::uint64_t total_invocations(std::uint64_t invocations_per_group) const;

 private:
  std::vector<BindingSpec>  bindings_;
  std::vector<ConstantSpec> constants_;
  Extent3                   extent_;
  std::unordered_map<std::string, std::size_t> binding_slots_;
  std::unordered_map<std::string, std::size_t> constant_slots_by_name_;
  std::vector<std::byte>    constant_block_;
  std::vector<ConstantSlot> constant_slots_;
};

// Typed builder; validation happens in build().
//
//   auto desc = WorkloadBuilder()
//                   .buffer<float>("result", 640000)
//                   .constant("a", 4.0f)
//                   .constant("b", 10.0f)
//                   .extent(100, 100, 1)
//                   .build();
class WorkloadBuilder {
 public:
  template <typename T>
  WorkloadBuilder& buffer(std::string name, std::size_t count) {
    bindings_.push_back(BindingSpec{std::move(name), core::scalar_type_of<T>, count});
    return *this;
  }

  WorkloadBuilder& buffer(std::string name, ScalarType type, std::size_t count) {
    bindings_.push_back(BindingSpec{std::move(name), type, count});
    return *this;
  }

  WorkloadBuilder& constant(std::string name, ConstantValue value) {
    constants_.push_back(ConstantSpec{std::move(name), value});
    return *this;
  }

  WorkloadBuilder& extent(std::uint32_t x, std::uint32_t y = 1, std::uint32_t z = 1) {
    extent_ = Extent3{x, y, z};
    return *this;
  }

  WorkloadDescriptor build() const {
    return WorkloadDescriptor(bindings_, constants_, extent_);
  }

 private:
  std::vector<BindingSpec>  bindings_;
  std::vector<ConstantSpec> constants_;
  Extent3                   extent_{};
};

} // namespace workload
} // namespace ktest
