// Bundle Signer - Detached signing for Android App Bundles
// Copyright (c) 2021 Bundle Signer contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "util.h"
#include <errno.h>
#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <limits.h>
#include <unistd.h>
#include <sys/types.h>
#include <dirent.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/sendfile.h>

namespace bundlesigner {

Pipe Pipe::make() {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  return { kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1]) };
}

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode) {
  int fd;
  KJ_SYSCALL(fd = open(name.cStr(), flags | O_CLOEXEC, mode), name);
  return kj::AutoCloseFd(fd);
}

kj::Maybe<kj::AutoCloseFd> raiiOpenIfExists(kj::StringPtr name, int flags, mode_t mode) {
  int fd = open(name.cStr(), flags | O_CLOEXEC, mode);
  if (fd == -1) {
    if (errno == ENOENT) {
      return nullptr;
    } else {
      KJ_FAIL_SYSCALL("open", errno, name);
    }
  } else {
    return kj::AutoCloseFd(fd);
  }
}

size_t getFileSize(int fd, kj::StringPtr filename) {
  struct stat stats;
  KJ_SYSCALL(fstat(fd, &stats));
  KJ_REQUIRE(S_ISREG(stats.st_mode), "Not a regular file.", filename);
  return stats.st_size;
}

bool fileExists(kj::StringPtr path) {
  struct stat stats;
  if (stat(path.cStr(), &stats) < 0) {
    int error = errno;
    if (error == ENOENT || error == ENOTDIR) return false;
    KJ_FAIL_SYSCALL("stat", error, path);
  }
  return S_ISREG(stats.st_mode);
}

bool isDirectory(kj::StringPtr path) {
  struct stat stats;
  if (stat(path.cStr(), &stats) < 0) {
    int error = errno;
    if (error == ENOENT || error == ENOTDIR) return false;
    KJ_FAIL_SYSCALL("stat", error, path);
  }
  return S_ISDIR(stats.st_mode);
}

kj::Maybe<kj::String> readLine(kj::BufferedInputStream& input) {
  kj::Vector<char> result(80);

  for (;;) {
    auto buffer = input.tryGetReadBuffer();
    if (buffer.size() == 0) {
      if (result.size() == 0) return nullptr;
      result.add('\0');
      return kj::String(result.releaseAsArray());
    }
    for (size_t i: kj::indices(buffer)) {
      if (buffer[i] == '\n') {
        input.skip(i+1);
        result.add('\0');
        return kj::String(result.releaseAsArray());
      } else {
        result.add(buffer[i]);
      }
    }
    input.skip(buffer.size());
  }
}

kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice) {
  while (slice.size() > 0 && isspace(slice[0])) {
    slice = slice.slice(1, slice.size());
  }
  while (slice.size() > 0 && isspace(slice[slice.size() - 1])) {
    slice = slice.slice(0, slice.size() - 1);
  }

  return slice;
}

kj::String trim(kj::ArrayPtr<const char> slice) {
  return kj::heapString(trimArray(slice));
}

kj::Maybe<uint> parseUInt(kj::StringPtr s, int base) {
  char* end;
  errno = 0;
  unsigned long result = strtoul(s.cStr(), &end, base);
  if (s.size() == 0 || *end != '\0' || errno == ERANGE || result > UINT_MAX) {
    return nullptr;
  }
  return static_cast<uint>(result);
}

kj::Maybe<bool> parseBool(kj::StringPtr s) {
  if (strcasecmp(s.cStr(), "true") == 0) {
    return true;
  } else if (strcasecmp(s.cStr(), "false") == 0) {
    return false;
  } else {
    return nullptr;
  }
}

kj::Maybe<size_t> findSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  if (needle.size() <= haystack.size()) {
    for (size_t i = 0; i <= haystack.size() - needle.size(); i++) {
      if (haystack.slice(i).startsWith(needle)) {
        return i;
      }
    }
  }
  return nullptr;
}

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  return findSubstring(haystack, needle) != nullptr;
}

kj::StringPtr leafName(kj::StringPtr path) {
  KJ_IF_MAYBE(slash, path.findLast('/')) {
    return path.slice(*slash + 1);
  } else {
    return path;
  }
}

kj::String stem(kj::StringPtr fileName) {
  auto leaf = leafName(fileName);
  KJ_IF_MAYBE(dot, leaf.findFirst('.')) {
    return kj::heapString(leaf.slice(0, *dot));
  } else {
    return kj::heapString(leaf);
  }
}

kj::String absolutePath(kj::StringPtr path) {
  if (path.startsWith("/")) {
    return kj::heapString(path);
  }

  char buf[PATH_MAX + 1];
  if (getcwd(buf, sizeof(buf)) == nullptr) {
    KJ_FAIL_SYSCALL("getcwd", errno);
  }
  return kj::str(buf, "/", path);
}

kj::Array<kj::String> listDirectory(kj::StringPtr dirname) {
  DIR* dir = opendir(dirname.cStr());
  if (dir == nullptr) {
    KJ_FAIL_SYSCALL("opendir", errno, dirname);
  }
  KJ_DEFER(closedir(dir));
  kj::Vector<kj::String> entries;

  for (;;) {
    errno = 0;
    struct dirent* entry = readdir(dir);
    if (entry == nullptr) {
      int error = errno;
      if (error == 0) {
        break;
      } else {
        KJ_FAIL_SYSCALL("readdir", error, dirname);
      }
    }

    kj::StringPtr name = entry->d_name;
    if (name != "." && name != "..") {
      entries.add(kj::heapString(entry->d_name));
    }
  }

  return entries.releaseAsArray();
}

void recursivelyDelete(kj::StringPtr path) {
  KJ_REQUIRE(!path.endsWith("/"),
      "refusing to recursively delete directory name with trailing / to reduce risk of "
      "catastrophic empty-string bugs");
  struct stat stats;
  KJ_SYSCALL(lstat(path.cStr(), &stats), path) { return; }
  if (S_ISDIR(stats.st_mode)) {
    for (auto& file: listDirectory(path)) {
      recursivelyDelete(kj::str(path, "/", file));
    }
    KJ_SYSCALL(rmdir(path.cStr()), path) { break; }
  } else {
    KJ_SYSCALL(unlink(path.cStr()), path) { break; }
  }
}

void recursivelyCreateParent(kj::StringPtr path) {
  KJ_IF_MAYBE(pos, path.findLast('/')) {
    if (*pos == 0) return;
    recursivelyCreateDirectory(kj::heapString(path.slice(0, *pos)));
  }
}

void recursivelyCreateDirectory(kj::StringPtr path) {
  bool firstTry = true;
  while (mkdir(path.cStr(), 0777) < 0) {
    int error = errno;
    if (firstTry && error == ENOENT) {
      recursivelyCreateParent(path);
      firstTry = false;
    } else if (error == EEXIST) {
      KJ_REQUIRE(isDirectory(path), "path exists and is not a directory", path);
      break;
    } else if (error != EINTR) {
      KJ_FAIL_SYSCALL("mkdir", error, path);
    }
  }
}

static void pumpFile(int in, int out, kj::StringPtr from) {
  size_t remaining = getFileSize(in, from);
  while (remaining > 0) {
    ssize_t n;
    KJ_SYSCALL(n = sendfile(out, in, nullptr, remaining), from);
    KJ_ASSERT(n > 0, "file shrank while copying", from);
    remaining -= n;
  }
}

void copyFile(kj::StringPtr from, kj::StringPtr to) {
  auto in = raiiOpen(from, O_RDONLY);
  auto out = raiiOpen(to, O_WRONLY | O_CREAT | O_TRUNC);
  pumpFile(in, out, from);
}

kj::String readAll(int fd) {
  kj::FdInputStream input(fd);
  kj::Vector<char> content;
  for (;;) {
    char buffer[4096];
    size_t n = input.tryRead(buffer, sizeof(buffer), sizeof(buffer));
    content.addAll(buffer, buffer + n);
    if (n < sizeof(buffer)) {
      // Done!
      break;
    }
  }
  content.add('\0');
  return kj::String(content.releaseAsArray());
}

kj::String readAll(kj::StringPtr name) {
  return readAll(raiiOpen(name, O_RDONLY));
}

void writeAll(kj::StringPtr name, kj::StringPtr content) {
  auto fd = raiiOpen(name, O_WRONLY | O_CREAT | O_TRUNC);
  kj::FdOutputStream(fd.get()).write(content.begin(), content.size());
}

kj::Array<kj::String> splitLines(kj::StringPtr input) {
  size_t lineStart = 0;
  kj::Vector<kj::String> results;
  for (size_t i = 0; i < input.size(); i++) {
    if (input[i] == '\n' || input[i] == '#') {
      bool hasComment = input[i] == '#';
      auto line = trim(input.slice(lineStart, i));
      if (line.size() > 0) {
        results.add(kj::mv(line));
      }
      if (hasComment) {
        // Ignore through newline.
        ++i;
        while (i < input.size() && input[i] != '\n') ++i;
      }
      lineStart = i + 1;
    }
  }

  if (lineStart < input.size()) {
    auto lastLine = trim(input.slice(lineStart));
    if (lastLine.size() > 0) {
      results.add(kj::mv(lastLine));
    }
  }

  return results.releaseAsArray();
}

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim) {
  kj::Vector<kj::ArrayPtr<const char>> result;

  size_t start = 0;
  for (size_t i: kj::indices(input)) {
    if (input[i] == delim) {
      result.add(input.slice(start, i));
      start = i + 1;
    }
  }
  result.add(input.slice(start, input.size()));
  return result;
}

kj::Vector<kj::ArrayPtr<const char>> splitSpace(kj::ArrayPtr<const char> input) {
  kj::Vector<kj::ArrayPtr<const char>> result;

  size_t start = 0;
  for (size_t i: kj::indices(input)) {
    if (isspace(input[i])) {
      if (i > start) {
        result.add(input.slice(start, i));
      }
      start = i + 1;
    }
  }
  if (input.size() > start) {
    result.add(input.slice(start, input.size()));
  }
  return result;
}

kj::Maybe<kj::ArrayPtr<const char>> splitFirst(kj::ArrayPtr<const char>& input, char delim) {
  for (size_t i: kj::indices(input)) {
    if (input[i] == delim) {
      auto result = input.slice(0, i);
      input = input.slice(i + 1, input.size());
      return result;
    }
  }
  return nullptr;
}

kj::String hexEncode(kj::ArrayPtr<const byte> input) {
  const char DIGITS[] = "0123456789abcdef";
  auto result = kj::heapString(input.size() * 2);
  for (size_t i: kj::indices(input)) {
    result[i * 2] = DIGITS[input[i] >> 4];
    result[i * 2 + 1] = DIGITS[input[i] & 0x0f];
  }
  return result;
}

// =======================================================================================

Subprocess::Subprocess(Options&& options)
    : name(kj::heapString(options.argv.size() > 0 ? options.argv[0] : options.executable)) {
  KJ_SYSCALL(pid = fork());
  if (pid == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      // Reset all signal handlers to default.  (exec() will leave ignored signals ignored, and KJ
      // code likes to ignore e.g. SIGPIPE.)
      for (uint i = 1; i < NSIG; i++) {
        ::signal(i, SIG_DFL);  // Only possible error is EINVAL (invalid signum); we don't care.
      }

      // Unblock all signals.  (Yes, the signal mask is inherited over exec...)
      sigset_t sigmask;
      sigemptyset(&sigmask);
      KJ_SYSCALL(sigprocmask(SIG_SETMASK, &sigmask, nullptr));

      // Make sure none of the incoming FDs sit in a standard I/O slot that another one is about
      // to be dup2()ed over.
      int minFd = STDERR_FILENO + 1;
      if (options.stdin != STDIN_FILENO) forceFdAbove(options.stdin, minFd);
      if (options.stdout != STDOUT_FILENO) forceFdAbove(options.stdout, minFd);
      if (options.stderr != STDERR_FILENO) forceFdAbove(options.stderr, minFd);

      if (options.stdin != STDIN_FILENO) {
        KJ_SYSCALL(dup2(options.stdin, STDIN_FILENO));
      }
      if (options.stdout != STDOUT_FILENO) {
        KJ_SYSCALL(dup2(options.stdout, STDOUT_FILENO));
      }
      if (options.stderr != STDERR_FILENO) {
        KJ_SYSCALL(dup2(options.stderr, STDERR_FILENO));
      }

      KJ_IF_MAYBE(dir, options.workingDirectory) {
        KJ_SYSCALL(chdir(dir->cStr()), *dir);
      }

      // Make the args vector.
      char* argv[options.argv.size() + 1];
      for (auto i: kj::indices(options.argv)) {
        // exec*() is not const-correct. :(
        argv[i] = const_cast<char*>(options.argv[i].cStr());
      }
      argv[options.argv.size()] = nullptr;

      if (options.searchPath) {
        KJ_SYSCALL(execvp(options.executable.cStr(), argv), options.executable);
      } else {
        KJ_SYSCALL(execv(options.executable.cStr(), argv), options.executable);
      }

      KJ_UNREACHABLE;
    })) {
      KJ_LOG(FATAL, *exception);
    }
  }
}

Subprocess::Subprocess(kj::Function<int()> func) {
  KJ_SYSCALL(pid = fork());
  if (pid == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!

    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      _exit(func());
    })) {
      KJ_LOG(FATAL, *exception);
    }
  }
}

Subprocess::~Subprocess() noexcept(false) {
  if (pid != 0) {
    unwindDetector.catchExceptionsIfUnwinding([this]() {
      signal(SIGKILL);
      (void)waitForExitOrSignal();
    });
  }
}

void Subprocess::signal(int signo) {
  if (pid != 0) {
    KJ_SYSCALL(kill(pid, signo), name);
  }
}

void Subprocess::waitForSuccess() {
  int exitCode = waitForExit();
  KJ_ASSERT(exitCode == 0, "child process failed", name, exitCode);
}

int Subprocess::waitForExit() {
  int status = waitForExitOrSignal();
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    int signo = WTERMSIG(status);
    KJ_FAIL_ASSERT("child process killed by signal", name, signo, strsignal(signo));
  } else {
    KJ_FAIL_ASSERT("unknown child wait status", name, status);
  }
}

int Subprocess::waitForExitOrSignal() {
  KJ_REQUIRE(pid != 0, "already waited for this child");
  int status;
  KJ_SYSCALL(waitpid(pid, &status, 0), name);
  pid = 0;
  return status;
}

void Subprocess::forceFdAbove(int& fd, int minValue) {
  if (fd < minValue) {
    // F_DUPFD picks the lowest free slot at or above `minValue`. The copy is close-on-exec since
    // it is dup2()ed back into place before exec.
    KJ_SYSCALL(fd = fcntl(fd, F_DUPFD_CLOEXEC, minValue));
  }
}

CommandResult runCommand(kj::ArrayPtr<const kj::StringPtr> argv) {
  KJ_REQUIRE(argv.size() > 0, "empty command line");

  auto pipe = Pipe::make();
  Subprocess::Options options(argv);
  options.stdout = pipe.writeEnd;
  options.stderr = pipe.writeEnd;
  Subprocess child(kj::mv(options));
  pipe.writeEnd = nullptr;

  auto output = readAll(pipe.readEnd);
  int exitCode = child.waitForExit();
  return { exitCode, kj::mv(output) };
}

}  // namespace bundlesigner
