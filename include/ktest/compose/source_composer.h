// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace ktest {
namespace compose {

// Receives one notification per consumed fragment (the fragment path, as
// given). Meant for incremental-build watchers.
using DependencySink = std::function<void(const std::string& path)>;

// Prints each fragment path on its own line to stdout.
DependencySink stdout_dependency_sink();

// Prefix of the location-reset directive; completed by `<path>"\n`.
inline constexpr std::string_view kLineDirectivePrefix = "#line 1 \"";

// Builds the directive that attributes the following lines to `path`,
// starting at line 1.
std::string line_directive(std::string_view path);

// Concatenates `fragments` into `output`.
//
// The first fragment is copied verbatim. Every later fragment is preceded by
// a `#line 1 "<path>"` directive so compiler diagnostics point at the
// original file and line. Parent directories of `output` are created as
// needed. The composite is staged in a temporary sibling and renamed into
// place, so readers never observe a partial file.
//
// Throws ktest::Error with ErrorKind::Configuration for an empty fragment
// list (no file is created) and ErrorKind::Io for unreadable fragments or an
// uncreatable output.
void concatenate(std::span<const std::string> fragments,
                 const std::string& output,
                 const DependencySink& sink = stdout_dependency_sink());

// Composes a kernel test from the conventional layout:
//   <test_root>/<group>/<name>_header<extension>
//   segments...
//   <test_root>/<group>/<name>_main<extension>
// into <output_root>/<name><extension>. Returns the output path.
std::string compose_test_program(std::string_view group,
                                 std::string_view name,
                                 std::span<const std::string> segments,
                                 std::string_view test_root,
                                 std::string_view output_root,
                                 std::string_view extension = ".cu",
                                 const DependencySink& sink = stdout_dependency_sink());

} // namespace compose
} // namespace ktest
