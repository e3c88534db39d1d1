// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/core/config.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <string>

#include "ktest/logging/logging.h"

namespace ktest {
namespace core {

namespace {

void trim(std::string& t) {
  auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n'; };
  size_t a = 0;
  while (a < t.size() && is_space(t[a])) ++a;
  size_t b = t.size();
  while (b > a && is_space(t[b - 1])) --b;
  t = t.substr(a, b - a);
}

// Strict: only decimal digits allowed; reject any sign or other chars
bool to_uint(const std::string& t, std::uint64_t& out) {
  if (t.empty()) return false;
  for (unsigned char ch : t) {
    if (!std::isdigit(ch)) return false;
  }
  char* end = nullptr;
  errno = 0;
  unsigned long long x = std::strtoull(t.c_str(), &end, 10);
  if (errno != 0 || (end && *end != '\0')) return false;
  out = static_cast<std::uint64_t>(x);
  return true;
}

bool to_bool(const std::string& t, bool& out) {
  std::string u = t;
  for (auto& c : u) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (u == "1" || u == "true" || u == "yes" || u == "on") { out = true; return true; }
  if (u == "0" || u == "false" || u == "no" || u == "off") { out = false; return true; }
  return false;
}

void warn_ignored(const std::string& key, const std::string& val) {
  KTEST_LOG(WARNING) << "[KTEST_HARNESS_CONF] ignoring " << key << "='" << val << "'";
}

} // namespace

HarnessConfig HarnessConfig::parse(std::string_view conf) {
  HarnessConfig cfg;
  const std::string s(conf);
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == ',')) ++i;
    if (i >= s.size()) break;
    size_t k0 = i;
    while (i < s.size() && s[i] != '=' && s[i] != ',') ++i;
    std::string key = s.substr(k0, i - k0);
    if (i >= s.size() || s[i] != '=') {
      trim(key);
      warn_ignored(key, "");
      continue;
    }
    ++i;
    size_t v0 = i;
    while (i < s.size() && s[i] != ',') ++i;
    std::string val = s.substr(v0, i - v0);
    trim(key);
    trim(val);

    std::uint64_t u = 0;
    bool b = false;
    if (key == "device") {
      if (to_uint(val, u) && u <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        cfg.device_index = static_cast<int>(u);
      } else {
        warn_ignored(key, val);
      }
    } else if (key == "poll_us") {
      if (to_uint(val, u) && u > 0 && u <= std::numeric_limits<std::uint32_t>::max()) {
        cfg.poll_interval_us = static_cast<std::uint32_t>(u);
      } else {
        warn_ignored(key, val);
      }
    } else if (key == "timeout_ms") {
      if (to_uint(val, u) &&
          u <= static_cast<std::uint64_t>(std::chrono::milliseconds::max().count())) {
        cfg.default_timeout_ms = u;
      } else {
        warn_ignored(key, val);
      }
    } else if (key == "poison") {
      if (to_bool(val, b)) cfg.poison_allocations = b;
      else warn_ignored(key, val);
    } else if (key == "log_level") {
      if (to_uint(val, u) && u <= 3) cfg.log_level = static_cast<int>(u);
      else warn_ignored(key, val);
    } else {
      warn_ignored(key, val);
    }
  }
  return cfg;
}

HarnessConfig HarnessConfig::from_env() {
  const char* env = std::getenv("KTEST_HARNESS_CONF");
  if (!env || !*env) return HarnessConfig{};
  return parse(env);
}

} // namespace core
} // namespace ktest
