// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// ktest_compose -o <output> <fragment> [<fragment>...]
//
// Concatenates kernel source fragments with #line directives between them.
// Prints one line per consumed fragment on stdout for build-dependency
// tracking. Exit status: 0 success, 1 I/O failure, 2 usage/configuration.

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "ktest/compose/source_composer.h"
#include "ktest/core/error.h"
#include "ktest/logging/logging.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitIo = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* argv0) {
  std::fprintf(stderr, "usage: %s -o <output> <fragment> [<fragment>...]\n", argv0);
}

} // namespace

int main(int argc, char** argv) {
  ktest::InitLogging(std::nullopt);

  std::string output;
  std::vector<std::string> fragments;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "-o") {
      if (i + 1 >= argc) {
        print_usage(argv[0]);
        return kExitUsage;
      }
      output = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return kExitOk;
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::fprintf(stderr, "%s: unknown option '%s'\n", argv[0], argv[i]);
      print_usage(argv[0]);
      return kExitUsage;
    } else {
      fragments.emplace_back(arg);
    }
  }

  try {
    ktest::compose::concatenate(fragments, output);
  } catch (const ktest::Error& e) {
    std::fprintf(stderr, "%s: %s\n", argv[0], e.what());
    if (e.kind() == ktest::ErrorKind::Configuration) {
      print_usage(argv[0]);
      return kExitUsage;
    }
    return kExitIo;
  }
  return kExitOk;
}
