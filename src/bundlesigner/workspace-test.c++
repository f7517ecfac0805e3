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

#include "workspace.h"
#include "test-util.h"
#include "util.h"
#include <kj/test.h>
#include <kj/vector.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bundlesigner {
namespace {

class TestContext final: public kj::ProcessContext {
public:
  kj::Vector<kj::String> warnings;

  kj::StringPtr getProgramName() override { return "workspace-test"; }
  void exit() override { KJ_FAIL_ASSERT("unexpected exit()"); }
  void warning(kj::StringPtr message) override { warnings.add(kj::heapString(message)); }
  void error(kj::StringPtr message) override { KJ_FAIL_ASSERT("unexpected error()", message); }
  void exitError(kj::StringPtr message) override {
    KJ_FAIL_ASSERT("unexpected exitError()", message);
  }
  void exitInfo(kj::StringPtr message) override {
    KJ_FAIL_ASSERT("unexpected exitInfo()", message);
  }
  void increaseLoggingVerbosity() override {}
};

KJ_TEST("Workspace lifecycle") {
  kj::String path;
  {
    Workspace workspace(testTmpDir());
    path = kj::heapString(workspace.getPath());
    KJ_EXPECT(isDirectory(path));
    KJ_EXPECT(leafName(path).startsWith("bundle_signer."), path);

    KJ_EXPECT(workspace.getV1LogPath() == kj::str(path, "/binv1"));
    KJ_EXPECT(workspace.getV2V3LogPath() == kj::str(path, "/binv2_v3"));
    KJ_EXPECT(workspace.getScratchPath() == kj::str(path, "/tmp_bin"));
    KJ_EXPECT(workspace.getKeystorePath() == kj::str(path, "/default.keystore"));

    auto split = workspace.freshDirectory("split");
    writeAll(kj::str(split, "/leftover.apk"), "x");
    KJ_EXPECT(workspace.freshDirectory("split") == split);
    KJ_EXPECT(listDirectory(split).size() == 0);
  }
  KJ_EXPECT(!isDirectory(path));
}

KJ_TEST("Workspace cleanup") {
  Workspace workspace(testTmpDir());
  kj::String path = kj::heapString(workspace.getPath());
  writeAll(workspace.file("binv1"), "a.apk\nx\n");

  KJ_EXPECT(workspace.cleanup());
  KJ_EXPECT(!isDirectory(path));
  KJ_EXPECT(workspace.cleanup());
}

KJ_TEST("Workspaces don't collide") {
  Workspace a(testTmpDir());
  Workspace b(testTmpDir());
  KJ_EXPECT(a.getPath() != b.getPath());
}

KJ_TEST("runInterruptible returns the phase's exit status") {
  TestContext context;

  int status = runInterruptible(context, []() -> int { return 5; });
  KJ_ASSERT(WIFEXITED(status));
  KJ_EXPECT(WEXITSTATUS(status) == 5);

  status = runInterruptible(context, []() -> int { return 0; });
  KJ_ASSERT(WIFEXITED(status));
  KJ_EXPECT(WEXITSTATUS(status) == 0);
  KJ_EXPECT(context.warnings.size() == 0);
}

KJ_TEST("runInterruptible forwards termination signals") {
  TestContext context;

  // The phase signals us and waits; we should pass the signal on to it rather than die.
  int status = runInterruptible(context, []() -> int {
    kill(getppid(), SIGTERM);
    for (;;) pause();
  });

  KJ_ASSERT(WIFSIGNALED(status));
  KJ_EXPECT(WTERMSIG(status) == SIGTERM);
  KJ_ASSERT(context.warnings.size() == 1);
  KJ_EXPECT(context.warnings[0].startsWith("Stopping due to signal"), context.warnings[0]);
}

}  // namespace
}  // namespace bundlesigner
