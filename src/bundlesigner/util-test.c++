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
#include "test-util.h"
#include "workspace.h"
#include <kj/test.h>
#include <kj/vector.h>
#include <sys/wait.h>
#include <signal.h>

namespace bundlesigner {
namespace {

KJ_TEST("Subprocess") {
  {
    Subprocess child({"true"});
    child.waitForSuccess();
  }

  {
    Subprocess child({"false"});
    KJ_EXPECT(child.waitForExit() != 0);
  }

  {
    Subprocess child({"false"});
    KJ_EXPECT_THROW_MESSAGE("child process failed", child.waitForSuccess());
  }

  {
    Subprocess child({"cat"});
    // Will be killed by destructor.
  }

  {
    Subprocess child({"sleep", "10"});
    child.signal(SIGTERM);
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFSIGNALED(status));
    KJ_EXPECT(WTERMSIG(status) == SIGTERM);
  }

  {
    Subprocess child([]() -> int { return 7; });
    KJ_EXPECT(child.waitForExit() == 7);
  }
}

KJ_TEST("Subprocess working directory and redirection") {
  Workspace dir(testTmpDir());
  auto pipe = Pipe::make();

  Subprocess::Options options({"pwd"});
  options.workingDirectory = dir.getPath();
  options.stdout = pipe.writeEnd;
  Subprocess child(kj::mv(options));
  pipe.writeEnd = nullptr;

  auto output = readAll(pipe.readEnd);
  child.waitForSuccess();
  // The temp dir may be reached through a symlink, so only compare the leaf.
  KJ_EXPECT(trim(output).endsWith(leafName(dir.getPath())), output);
}

KJ_TEST("runCommand captures stdout and stderr") {
  kj::StringPtr argv[] = { "sh", "-c", "echo out; echo err >&2; exit 3" };
  auto result = runCommand(argv);
  KJ_EXPECT(result.exitCode == 3);
  KJ_EXPECT(contains(result.output, "out\n"), result.output);
  KJ_EXPECT(contains(result.output, "err\n"), result.output);
}

KJ_TEST("splitLines") {
  auto lines = splitLines("  FOO = bar \n\n# comment\nBAZ=qux # trailing\nLAST=1");
  KJ_ASSERT(lines.size() == 3);
  KJ_EXPECT(lines[0] == "FOO = bar");
  KJ_EXPECT(lines[1] == "BAZ=qux");
  KJ_EXPECT(lines[2] == "LAST=1");
}

KJ_TEST("split and splitSpace") {
  auto parts = split(kj::StringPtr("a/b//c"), '/');
  KJ_ASSERT(parts.size() == 4);
  KJ_EXPECT(kj::heapString(parts[1]) == "b");
  KJ_EXPECT(parts[2].size() == 0);

  auto words = splitSpace(kj::StringPtr("  java   -jar\tbundletool.jar "));
  KJ_ASSERT(words.size() == 3);
  KJ_EXPECT(kj::heapString(words[0]) == "java");
  KJ_EXPECT(kj::heapString(words[2]) == "bundletool.jar");
}

KJ_TEST("parseUInt and parseBool") {
  auto level = parseUInt("21", 10);
  KJ_EXPECT(KJ_ASSERT_NONNULL(level) == 21);
  KJ_EXPECT(parseUInt("", 10) == nullptr);
  KJ_EXPECT(parseUInt("12abc", 10) == nullptr);
  KJ_EXPECT(parseUInt("99999999999", 10) == nullptr);

  auto yes = parseBool("true");
  auto upper = parseBool("TRUE");
  auto no = parseBool("false");
  KJ_EXPECT(KJ_ASSERT_NONNULL(yes));
  KJ_EXPECT(KJ_ASSERT_NONNULL(upper));
  KJ_EXPECT(!KJ_ASSERT_NONNULL(no));
  KJ_EXPECT(parseBool("yes") == nullptr);
}

KJ_TEST("path helpers") {
  KJ_EXPECT(leafName("/a/b/app.release.aab") == "app.release.aab");
  KJ_EXPECT(leafName("app.aab") == "app.aab");
  KJ_EXPECT(stem("/a/b/app.release.aab") == "app");
  KJ_EXPECT(stem("noext") == "noext");
  KJ_EXPECT(absolutePath("/x/y") == "/x/y");
  KJ_EXPECT(absolutePath("y").endsWith("/y"));
  KJ_EXPECT(absolutePath("y").startsWith("/"));
}

KJ_TEST("findSubstring") {
  auto pos = findSubstring("splits/base.apk", ".apk");
  KJ_EXPECT(KJ_ASSERT_NONNULL(pos) == 11);
  KJ_EXPECT(findSubstring("toc.pb", ".apk") == nullptr);
  KJ_EXPECT(findSubstring("a", "abc") == nullptr);
  KJ_EXPECT(contains("universal.apk", "universal"));
}

KJ_TEST("hexEncode") {
  const byte BYTES[] = { 0x00, 0x7f, 0xab, 0xff };
  KJ_EXPECT(hexEncode(BYTES) == "007fabff");
  KJ_EXPECT(hexEncode(nullptr) == "");
}

KJ_TEST("readLine returns a final unterminated line") {
  kj::StringPtr text = "first\n\nlast";
  kj::ArrayInputStream input(kj::arrayPtr(reinterpret_cast<const byte*>(text.begin()),
                                          text.size()));

  kj::Vector<kj::String> lines;
  for (;;) {
    auto line = readLine(input);
    KJ_IF_MAYBE(l, line) {
      lines.add(kj::mv(*l));
    } else {
      break;
    }
  }

  KJ_ASSERT(lines.size() == 3);
  KJ_EXPECT(lines[0] == "first");
  KJ_EXPECT(lines[1] == "");
  KJ_EXPECT(lines[2] == "last");
}

KJ_TEST("file helpers") {
  Workspace dir(testTmpDir());

  auto nested = dir.file("a/b/c");
  recursivelyCreateDirectory(nested);
  KJ_EXPECT(isDirectory(nested));
  KJ_EXPECT(!fileExists(nested));

  auto file = dir.file("a/b/c/data.txt");
  writeAll(file, "hello");
  KJ_EXPECT(fileExists(file));
  KJ_EXPECT(readAll(file) == "hello");

  writeAll(dir.file("copy.txt"), "previous, longer content");
  copyFile(file, dir.file("copy.txt"));
  KJ_EXPECT(readAll(dir.file("copy.txt")) == "hello");

  auto entries = listDirectory(dir.getPath());
  KJ_EXPECT(entries.size() == 2);

  recursivelyDelete(dir.file("a"));
  KJ_EXPECT(!isDirectory(dir.file("a")));
  KJ_EXPECT(raiiOpenIfExists(file, O_RDONLY) == nullptr);
}

}  // namespace
}  // namespace bundlesigner
