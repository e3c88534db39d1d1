// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "ktest/compose/source_composer.h"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <absl/strings/str_cat.h>

#include "ktest/core/error.h"
#include "ktest/logging/logging.h"

namespace ktest {
namespace compose {

namespace {

class Fd {
 public:
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() {
    if (fd_ >= 0) {
      (void)::close(fd_);
    }
  }

  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  [[nodiscard]] int get() const noexcept { return fd_; }

  // Closes now so errors from close() are observable.
  [[nodiscard]] int close() noexcept {
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc;
  }

 private:
  int fd_ = -1;
};

// Removes the staged composite unless committed.
class StagedFile {
 public:
  explicit StagedFile(std::string path) : path_(std::move(path)) {}
  ~StagedFile() {
    if (!committed_) {
      (void)::unlink(path_.c_str());
    }
  }

  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  const std::string& path() const noexcept { return path_; }
  void commit() noexcept { committed_ = true; }

 private:
  std::string path_;
  bool committed_ = false;
};

[[noreturn]] void throw_io(std::string_view what, const std::string& path, int err) {
  throw_error(ErrorKind::Io, Phase::Compose,
              absl::StrCat(what, ": ", path, ": ", std::strerror(err)));
}

[[nodiscard]] int open_readonly(const char* path) {
  int flags = O_RDONLY;
#ifdef O_CLOEXEC
  flags |= O_CLOEXEC;
#endif
  while (true) {
    const int fd = ::open(path, flags);
    if (fd >= 0) return fd;
    if (errno == EINTR) continue;
    return -1;
  }
}

std::vector<char> read_all_bytes(const std::string& path) {
  const int raw_fd = open_readonly(path.c_str());
  if (raw_fd < 0) {
    throw_io("failed to open input fragment", path, errno);
  }
  Fd fd(raw_fd);

  struct stat st {};
  while (::fstat(fd.get(), &st) != 0) {
    if (errno == EINTR) continue;
    throw_io("failed to stat input fragment", path, errno);
  }
  if (!S_ISREG(st.st_mode)) {
    throw_error(ErrorKind::Io, Phase::Compose,
                absl::StrCat("input fragment is not a regular file: ", path));
  }

  std::vector<char> buf;
  buf.reserve(static_cast<std::size_t>(st.st_size > 0 ? st.st_size : 0));
  char chunk[1 << 16];
  while (true) {
    const ssize_t nread = ::read(fd.get(), chunk, sizeof(chunk));
    if (nread < 0) {
      if (errno == EINTR) continue;
      throw_io("failed to read input fragment", path, errno);
    }
    if (nread == 0) break;
    buf.insert(buf.end(), chunk, chunk + nread);
  }
  return buf;
}

void write_all_bytes(int fd, const char* data, std::size_t size, const std::string& path) {
  const std::size_t max_io = static_cast<std::size_t>(std::numeric_limits<ssize_t>::max());
  std::size_t pos = 0;
  while (pos < size) {
    const std::size_t to_write = std::min(size - pos, max_io);
    const ssize_t nw = ::write(fd, data + pos, to_write);
    if (nw < 0) {
      if (errno == EINTR) continue;
      throw_io("failed to write composite", path, errno);
    }
    if (nw == 0) {
      throw_error(ErrorKind::Io, Phase::Compose,
                  absl::StrCat("failed to write composite: ", path, ": wrote 0 bytes"));
    }
    pos += static_cast<std::size_t>(nw);
  }
}

std::string parent_directory(const std::string& path) {
  const auto slash = path.find_last_of('/');
  if (slash == std::string::npos) return std::string();
  if (slash == 0) return std::string("/");
  return path.substr(0, slash);
}

// mkdir -p
void create_directories(const std::string& dir) {
  if (dir.empty()) return;
  std::size_t pos = 0;
  while (pos != std::string::npos) {
    pos = dir.find('/', pos + 1);
    const std::string prefix = dir.substr(0, pos);
    if (prefix.empty() || prefix == "/") continue;
    if (::mkdir(prefix.c_str(), 0755) == 0) continue;
    if (errno != EEXIST) {
      throw_io("failed to create output directory", prefix, errno);
    }
    struct stat st {};
    if (::stat(prefix.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
      throw_error(ErrorKind::Io, Phase::Compose,
                  absl::StrCat("failed to create output directory: ", prefix,
                               ": exists and is not a directory"));
    }
  }
}

} // namespace

DependencySink stdout_dependency_sink() {
  return [](const std::string& path) {
    std::fprintf(stdout, "%s\n", path.c_str());
    std::fflush(stdout);
  };
}

std::string line_directive(std::string_view path) {
  return absl::StrCat(kLineDirectivePrefix, path, "\"\n");
}

void concatenate(std::span<const std::string> fragments,
                 const std::string& output,
                 const DependencySink& sink) {
  if (fragments.empty()) {
    throw_error(ErrorKind::Configuration, Phase::Compose,
                "there must be at least one fragment to concatenate");
  }
  if (output.empty()) {
    throw_error(ErrorKind::Configuration, Phase::Compose, "output path is empty");
  }
  KTEST_LOG(INFO) << "composing " << fragments.size() << " fragment(s) into " << output;

  create_directories(parent_directory(output));

  std::string staged_template = output + ".XXXXXX";
  std::vector<char> name_buf(staged_template.begin(), staged_template.end());
  name_buf.push_back('\0');
  const int raw_fd = ::mkstemp(name_buf.data());
  if (raw_fd < 0) {
    throw_io("failed to open output file", output, errno);
  }
  Fd fd(raw_fd);
  StagedFile staged(std::string(name_buf.data()));
  (void)::fchmod(fd.get(), 0644);

  bool ends_with_newline = true;
  for (std::size_t i = 0; i < fragments.size(); ++i) {
    const std::string& fragment = fragments[i];
    std::vector<char> content = read_all_bytes(fragment);
    KTEST_VLOG(1) << "fragment " << i << ": " << fragment << " (" << content.size() << " bytes)";
    if (sink) sink(fragment);

    if (i > 0) {
      if (!ends_with_newline) {
        write_all_bytes(fd.get(), "\n", 1, output);
      }
      const std::string directive = line_directive(fragment);
      write_all_bytes(fd.get(), directive.data(), directive.size(), output);
    }
    write_all_bytes(fd.get(), content.data(), content.size(), output);
    if (!content.empty()) {
      ends_with_newline = content.back() == '\n';
    } else if (i > 0) {
      ends_with_newline = true;  // the directive itself ended the line
    }
  }

  if (fd.close() != 0) {
    throw_io("failed to close composite", output, errno);
  }
  if (::rename(staged.path().c_str(), output.c_str()) != 0) {
    throw_io("failed to move composite into place", output, errno);
  }
  staged.commit();
  KTEST_LOG(INFO) << "wrote " << output;
}

std::string compose_test_program(std::string_view group,
                                 std::string_view name,
                                 std::span<const std::string> segments,
                                 std::string_view test_root,
                                 std::string_view output_root,
                                 std::string_view extension,
                                 const DependencySink& sink) {
  if (name.empty()) {
    throw_error(ErrorKind::Configuration, Phase::Compose, "test program name is empty");
  }
  const std::string group_dir = group.empty() ? std::string(test_root)
                                              : absl::StrCat(test_root, "/", group);
  std::vector<std::string> fragments;
  fragments.reserve(segments.size() + 2);
  fragments.push_back(absl::StrCat(group_dir, "/", name, "_header", extension));
  fragments.insert(fragments.end(), segments.begin(), segments.end());
  fragments.push_back(absl::StrCat(group_dir, "/", name, "_main", extension));

  std::string output = absl::StrCat(output_root, "/", name, extension);
  concatenate(fragments, output, sink);
  return output;
}

} // namespace compose
} // namespace ktest
