// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/validate/reference_validator.h"

#include "ktest/core/error.h"
#include "ktest/logging/logging.h"

namespace ktest {
namespace validate {

namespace detail {

bool within_tolerance(double device, double host, const Tolerance& tol) noexcept {
  if (std::isnan(device) || std::isnan(host)) {
    return std::isnan(device) && std::isnan(host);
  }
  if (std::isinf(device) || std::isinf(host)) {
    return device == host;
  }
  return std::fabs(device - host) <= tol.absolute + tol.relative * std::fabs(host);
}

} // namespace detail

std::string CheckReport::message() const {
  if (!mismatch) {
    return absl::StrCat("ok: ", compared, " invocation(s) matched");
  }
  const Mismatch& m = *mismatch;
  if (m.field == "length" || m.field == "state length" || m.field == "output length") {
    return absl::StrCat(m.field, " mismatch: device has ", m.device_value,
                        " element(s), reference expects ", m.host_value);
  }
  return absl::StrCat("mismatch at invocation ", m.index, " (", m.field, "): device=",
                      m.device_value, " host=", m.host_value);
}

void require_ok(const CheckReport& report) {
  if (report.ok()) {
    KTEST_VLOG(1) << report.message();
    return;
  }
  const std::string message = report.message();
  KTEST_LOG(ERROR) << "validation failed: " << message;
  throw_error(ErrorKind::Validation, Phase::Validate, message);
}

} // namespace validate
} // namespace ktest
