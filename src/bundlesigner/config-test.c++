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

#include "config.h"
#include "test-util.h"
#include "util.h"
#include "workspace.h"
#include <kj/test.h>
#include <stdlib.h>

namespace bundlesigner {
namespace {

KJ_TEST("splitCommand") {
  auto parts = splitCommand("  java  -jar /opt/bundletool.jar ");
  KJ_ASSERT(parts.size() == 3);
  KJ_EXPECT(parts[0] == "java");
  KJ_EXPECT(parts[1] == "-jar");
  KJ_EXPECT(parts[2] == "/opt/bundletool.jar");

  KJ_EXPECT(splitCommand("   ").size() == 0);
}

KJ_TEST("default config") {
  auto config = defaultConfig();
  KJ_ASSERT(config.bundletool.size() == 1);
  KJ_EXPECT(config.bundletool[0] == "bundletool");
  KJ_EXPECT(config.keytool[0] == "keytool");
  KJ_EXPECT(config.signerTool[0] == "apksigner-detached");
  KJ_EXPECT(config.apksigner[0] == "apksigner");
  KJ_EXPECT(config.tmpDir.size() > 0);
}

KJ_TEST("readConfig") {
  Workspace workspace(testTmpDir());
  auto tmp = workspace.freshDirectory("tmp");
  auto path = workspace.file("bundlesigner.conf");
  writeAll(path, kj::str(
      "# Build machine settings\n"
      "BUNDLETOOL = java -jar /opt/bundletool.jar\n"
      "\n"
      "SIGNER_TOOL=/opt/signer/bin/apksigner-detached\n"
      "TMPDIR=", tmp, "\n"));

  auto config = readConfig(path);
  KJ_ASSERT(config.bundletool.size() == 3);
  KJ_EXPECT(config.bundletool[0] == "java");
  KJ_EXPECT(config.bundletool[2] == "/opt/bundletool.jar");
  KJ_ASSERT(config.signerTool.size() == 1);
  KJ_EXPECT(config.signerTool[0] == "/opt/signer/bin/apksigner-detached");
  KJ_EXPECT(config.tmpDir == tmp);

  // Unset keys keep their defaults.
  KJ_ASSERT(config.keytool.size() == 1);
  KJ_EXPECT(config.keytool[0] == "keytool");
}

KJ_TEST("readConfig warns about unknown keys") {
  Workspace workspace(testTmpDir());
  auto path = workspace.file("bundlesigner.conf");
  writeAll(path, "ZIPALIGN=zipalign\nKEYTOOL=/usr/lib/jvm/bin/keytool\n");

  KJ_EXPECT_LOG(WARNING, "Ignoring unrecognized config option");
  auto config = readConfig(path);
  KJ_EXPECT(config.keytool[0] == "/usr/lib/jvm/bin/keytool");
}

KJ_TEST("readConfig rejects bad lines") {
  Workspace workspace(testTmpDir());
  auto path = workspace.file("bundlesigner.conf");

  writeAll(path, "BUNDLETOOL\n");
  KJ_EXPECT_THROW_MESSAGE("Invalid config line", readConfig(path));

  writeAll(path, "KEYTOOL=\n");
  KJ_EXPECT_THROW_MESSAGE("config value must name a program", readConfig(path));

  writeAll(path, kj::str("TMPDIR=", workspace.file("nonexistent"), "\n"));
  KJ_EXPECT_THROW_MESSAGE("TMPDIR is not a directory", readConfig(path));
}

KJ_TEST("loadConfig") {
  Workspace workspace(testTmpDir());
  auto path = workspace.file("bundlesigner.conf");
  writeAll(path, "APKSIGNER=/opt/build-tools/apksigner\n");

  {
    auto config = loadConfig(kj::StringPtr(path));
    KJ_EXPECT(config.apksigner[0] == "/opt/build-tools/apksigner");
  }

  KJ_EXPECT(expectFailure([&]() {
    loadConfig(kj::StringPtr(workspace.file("missing.conf")));
  }) == ErrorKind::PARAMETER);

  KJ_SYSCALL(setenv("BUNDLESIGNER_CONFIG", path.cStr(), 1));
  {
    auto config = loadConfig(nullptr);
    KJ_EXPECT(config.apksigner[0] == "/opt/build-tools/apksigner");
  }

  auto missing = workspace.file("missing.conf");
  KJ_SYSCALL(setenv("BUNDLESIGNER_CONFIG", missing.cStr(), 1));
  KJ_EXPECT(expectFailure([&]() { loadConfig(nullptr); }) == ErrorKind::PARAMETER);

  KJ_SYSCALL(unsetenv("BUNDLESIGNER_CONFIG"));
}

}  // namespace
}  // namespace bundlesigner
