// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/workload/descriptor.h"

#include <cstring>
#include <utility>

#include <absl/strings/str_cat.h>

#include "ktest/core/checked_math.h"
#include "ktest/core/error.h"

namespace ktest {
namespace workload {

namespace {

[[noreturn]] void fail(std::string_view message) {
  throw_error(ErrorKind::Configuration, Phase::Describe, message);
}

} // namespace

ScalarType constant_type(const ConstantValue& v) noexcept {
  switch (v.index()) {
    case 0: return ScalarType::Int32;
    case 1: return ScalarType::UInt32;
    case 2: return ScalarType::Int64;
    case 3: return ScalarType::UInt64;
    case 4: return ScalarType::Float32;
    default: return ScalarType::Float64;
  }
}

WorkloadDescriptor::WorkloadDescriptor(std::vector<BindingSpec> bindings,
                                       std::vector<ConstantSpec> constants,
                                       Extent3 extent)
    : bindings_(std::move(bindings)),
      constants_(std::move(constants)),
      extent_(extent) {
  if (extent_.x == 0 || extent_.y == 0 || extent_.z == 0) {
    fail(absl::StrCat("dispatch extent must be strictly positive, got [",
                      extent_.x, ", ", extent_.y, ", ", extent_.z, "]"));
  }

  for (std::size_t i = 0; i < bindings_.size(); ++i) {
    const BindingSpec& b = bindings_[i];
    if (b.name.empty()) {
      fail(absl::StrCat("binding #", i, " has an empty name"));
    }
    if (b.count == 0) {
      fail(absl::StrCat("binding '", b.name, "' must have a positive element count"));
    }
    std::uint64_t nbytes = 0;
    if (!core::checked_mul_u64(b.count, core::itemsize(b.type), nbytes)) {
      fail(absl::StrCat("binding '", b.name, "' byte size overflows"));
    }
    if (!binding_slots_.emplace(b.name, i).second) {
      fail(absl::StrCat("duplicate binding name '", b.name, "'"));
    }
  }

  std::uint64_t offset = 0;
  constant_slots_.reserve(constants_.size());
  for (std::size_t i = 0; i < constants_.size(); ++i) {
    const ConstantSpec& c = constants_[i];
    if (c.name.empty()) {
      fail(absl::StrCat("constant #", i, " has an empty name"));
    }
    if (!constant_slots_by_name_.emplace(c.name, i).second) {
      fail(absl::StrCat("duplicate constant name '", c.name, "'"));
    }
    const std::size_t size = core::itemsize(constant_type(c.value));
    std::uint64_t aligned = 0;
    if (!core::checked_align_up_u64(offset, size, aligned)) {
      fail("constant block layout overflows");
    }
    constant_slots_.push_back(ConstantSlot{static_cast<std::size_t>(aligned), size});
    offset = aligned + size;
  }

  constant_block_.assign(static_cast<std::size_t>(offset), std::byte{0});
  for (std::size_t i = 0; i < constants_.size(); ++i) {
    std::byte* dst = constant_block_.data() + constant_slots_[i].offset;
    std::visit([dst](auto v) { std::memcpy(dst, &v, sizeof(v)); }, constants_[i].value);
  }
}

std::size_t WorkloadDescriptor::binding_index(std::string_view name) const {
  auto it = binding_slots_.find(std::string(name));
  if (it == binding_slots_.end()) {
    fail(absl::StrCat("unknown binding '", name, "'"));
  }
  return it->second;
}

std::size_t WorkloadDescriptor::constant_index(std::string_view name) const {
  auto it = constant_slots_by_name_.find(std::string(name));
  if (it == constant_slots_by_name_.end()) {
    fail(absl::StrCat("unknown constant '", name, "'"));
  }
  return it->second;
}

bool WorkloadDescriptor::has_binding(std::string_view name) const noexcept {
  return binding_slots_.find(std::string(name)) != binding_slots_.end();
}

std::size_t WorkloadDescriptor::binding_nbytes(std::size_t index) const {
  if (index >= bindings_.size()) {
    fail(absl::StrCat("binding index ", index, " out of range"));
  }
  return bindings_[index].count * core::itemsize(bindings_[index].type);
}

std::uint64_t WorkloadDescriptor::group_count() const {
  std::uint64_t xy = 0, xyz = 0;
  if (!core::checked_mul_u64(extent_.x, extent_.y, xy) ||
      !core::checked_mul_u64(xy, extent_.z, xyz)) {
    fail("group count overflows");
  }
  return xyz;
}

std::uint64_t WorkloadDescriptor::total_invocations(std::uint64_t invocations_per_group) const {
  if (invocations_per_group == 0) {
    fail("invocations per group must be positive");
  }
  std::uint64_t total = 0;
  if (!core::checked_mul_u64(group_count(), invocations_per_group, total)) {
    fail("total invocation count overflows");
  }
  return total;
}

} // namespace workload
} // namespace ktest
