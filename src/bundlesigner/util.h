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

#ifndef BUNDLESIGNER_UTIL_H_
#define BUNDLESIGNER_UTIL_H_
// File, string and process helpers shared by both signing phases.

#include <kj/io.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <kj/function.h>
#include <unistd.h>

namespace bundlesigner {

typedef unsigned int uint;
typedef unsigned char byte;

struct Pipe {
  kj::AutoCloseFd readEnd;
  kj::AutoCloseFd writeEnd;

  static Pipe make();
};

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode = 0666);

kj::Maybe<kj::AutoCloseFd> raiiOpenIfExists(
    kj::StringPtr name, int flags, mode_t mode = 0666);

size_t getFileSize(int fd, kj::StringPtr filename);

bool fileExists(kj::StringPtr path);
// True if `path` names an existing regular file (symlinks are followed).

bool isDirectory(kj::StringPtr path);

kj::Maybe<kj::String> readLine(kj::BufferedInputStream& input);
// Read one '\n'-terminated line, without the terminator. A final line lacking a newline is still
// returned. Returns null at EOF.

kj::String trim(kj::ArrayPtr<const char> slice);
kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice);
// Remove whitespace from both ends of the char array and return what's left as a String.

kj::Maybe<uint> parseUInt(kj::StringPtr s, int base);
// Try to parse an integer with strtoul(), return null if parsing fails or doesn't consume all
// input.

kj::Maybe<bool> parseBool(kj::StringPtr s);
// Accepts "true" and "false" (case-insensitive). Anything else is null.

bool contains(kj::StringPtr haystack, kj::StringPtr needle);

kj::Maybe<size_t> findSubstring(kj::StringPtr haystack, kj::StringPtr needle);
// Index of the first occurrence of `needle`, or null.

kj::StringPtr leafName(kj::StringPtr path);
// Last '/'-separated segment of `path`.

kj::String stem(kj::StringPtr fileName);
// Everything before the first '.' of the file name, e.g. "app.release.aab" -> "app".

kj::String absolutePath(kj::StringPtr path);
// Prefixes relative paths with the current working directory. Does not resolve symlinks.

kj::Array<kj::String> listDirectory(kj::StringPtr dirname);
// Get names of all files in the given directory except for "." and "..".

void recursivelyDelete(kj::StringPtr path);
// Delete the given path, recursively if it is a directory.
//
// Since this may be used in KJ_DEFER to delete temporary directories, all exceptions are
// recoverable (won't throw if already unwinding).

void recursivelyCreateParent(kj::StringPtr path);
// Create the parent directory of `path` if it doesn't exist, and the parent's parent, and so on.

void recursivelyCreateDirectory(kj::StringPtr path);
// Like `recursivelyCreateParent()` but also creates `path` itself. Existing directories are fine.

void copyFile(kj::StringPtr from, kj::StringPtr to);
// Copy the contents of `from` to `to`, replacing `to` if it exists.

kj::String readAll(int fd);
// Read entire contents of the file descirptor to a String.

kj::String readAll(kj::StringPtr name);
// Read entire contents of a named file to a String.

void writeAll(kj::StringPtr name, kj::StringPtr content);
// Replace the named file with `content`.

kj::Array<kj::String> splitLines(kj::StringPtr input);
// Split the input into lines, trimming whitespace, and ignoring blank lines or lines that start
// with #.

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim);
// Split the char array on an arbitrary delimiter character.

kj::Vector<kj::ArrayPtr<const char>> splitSpace(kj::ArrayPtr<const char> input);
// Split the char array on whitespace. Multiple consecutive spaces make a single split -- i.e.
// none of the elements in the returned vector will be empty.

kj::Maybe<kj::ArrayPtr<const char>> splitFirst(kj::ArrayPtr<const char>& input, char delim);
// Split the char array on the first instance of the delimiter. `input` is updated in-place to
// point at the remainder of the array while the prefix that was split off is returned. If the
// delimiter doesn't appear, returns null.

kj::String hexEncode(kj::ArrayPtr<const byte> input);
// Return the lower-case hex string corresponding to this array of bytes.

class Subprocess {
public:
  struct Options {
    kj::StringPtr executable;
    // Executable file name.

    bool searchPath = true;
    // Whether to search for `executable` in the `PATH` (e.g. use `execvp()` rather than
    // `execv()`). If `executable` contains a '/' character, this has no effect (`PATH` is never
    // searched).

    kj::ArrayPtr<const kj::StringPtr> argv;
    // Arguments to the program. By convention, the first argument should be the same as
    // `executable`.

    int stdin = STDIN_FILENO;
    int stdout = STDOUT_FILENO;
    int stderr = STDERR_FILENO;
    // What file descriptors to substitute for standard I/O. Overridden FDs are expected to be
    // close-on-exec.

    kj::Maybe<kj::StringPtr> workingDirectory;
    // Directory to chdir() into before exec. Null means inherit.

    Options(kj::StringPtr executable): executable(executable), argv(&this->executable, 1) {}
    Options(kj::ArrayPtr<const kj::StringPtr> argv): executable(argv[0]), argv(argv) {}
    Options(kj::Array<const kj::StringPtr>&& argv)
        : executable(argv[0]), argv(argv), ownArgv(kj::mv(argv)) {}
    Options(std::initializer_list<const kj::StringPtr> argv)
        : Options(kj::heapArray(argv)) {}

  private:
    kj::Array<const kj::StringPtr> ownArgv;
  };

  Subprocess(Options&& options);
  // Start a subprocess based on the given options.

  Subprocess(std::initializer_list<const kj::StringPtr> argv)
      : Subprocess(Options(kj::mv(argv))) {}

  Subprocess(kj::Function<int()> func);
  // Start a fork()ed subprocess that runs the given function then exits with its return value.
  // The child never unwinds the parent's stack and exits using _exit().

  KJ_DISALLOW_COPY(Subprocess);

  inline Subprocess(Subprocess&& other): name(kj::mv(other.name)), pid(other.pid) {
    other.pid = 0;
  }

  ~Subprocess() noexcept(false);
  // Kills the subprocess (with SIGKILL) and waitpid()s it if it hasn't already finished.

  void signal(int signo);
  // Sends the given signal to the child process.

  void waitForSuccess();
  // Wait for the child to exit. Throws an exception if it returns a non-zero exit status or is
  // killed by a signal.

  int waitForExit() KJ_WARN_UNUSED_RESULT;
  // Waits for the child to exit and returns the exit status. Throws an exception if it is killed
  // by a signal.

  int waitForExitOrSignal() KJ_WARN_UNUSED_RESULT;
  // Waits for the child to exit or be killed by a signal. Returns a raw wait status.

  pid_t getPid() {
    KJ_IREQUIRE(pid != 0, "already exited");
    return pid;
  }

  void notifyExited() {
    // Call if the child was reaped elsewhere (e.g. by waitpid() in an event loop) so that the
    // destructor doesn't SIGKILL a recycled pid.
    pid = 0;
  }

private:
  kj::String name;
  kj::UnwindDetector unwindDetector;
  pid_t pid = 0;  // 0 = not running

  static void forceFdAbove(int& fd, int minValue);
};

struct CommandResult {
  int exitCode;
  kj::String output;
  // Interleaved stdout and stderr.
};

CommandResult runCommand(kj::ArrayPtr<const kj::StringPtr> argv);
// Run the command to completion, capturing everything it prints. Throws only if the command
// could not be started or was killed by a signal.

}  // namespace bundlesigner

#endif // BUNDLESIGNER_UTIL_H_
