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

#include "bundle-expander.h"
#include "test-util.h"
#include "util.h"
#include "workspace.h"
#include <kj/test.h>

namespace bundlesigner {
namespace {

const char FAKE_KEYTOOL[] =
    "echo keytool \"$@\" >> \"$(dirname \"$0\")/calls.log\"\n"
    "while [ $# -gt 0 ]; do\n"
    "  if [ \"$1\" = -keystore ]; then ks=$2; fi\n"
    "  shift\n"
    "done\n"
    "echo keystore > \"$ks\"\n";

// Refuses to overwrite, like the real thing.
const char FAKE_BUNDLETOOL[] =
    "echo bundletool \"$@\" >> \"$(dirname \"$0\")/calls.log\"\n"
    "while [ $# -gt 0 ]; do\n"
    "  case \"$1\" in\n"
    "    --output) out=$2; shift 2 ;;\n"
    "    *) shift ;;\n"
    "  esac\n"
    "done\n"
    "if [ -e \"$out\" ]; then echo 'output exists' >&2; exit 9; fi\n"
    "echo archive > \"$out\"\n";

struct ExpanderFixture {
  Workspace tools;
  Workspace workspace;
  kj::String bundle;

  ExpanderFixture(kj::StringPtr bundletoolScript = FAKE_BUNDLETOOL,
                  kj::StringPtr keytoolScript = FAKE_KEYTOOL)
      : tools(testTmpDir()), workspace(testTmpDir()), bundle(tools.file("app.aab")) {
    writeScript(tools.file("bundletool"), bundletoolScript);
    writeScript(tools.file("keytool"), keytoolScript);
    writeAll(bundle, "bundle");
  }

  BundletoolExpander makeExpander() {
    return BundletoolExpander(workspace, command("bundletool"), command("keytool"));
  }

  kj::Array<kj::String> command(kj::StringPtr name) {
    auto result = kj::heapArray<kj::String>(1);
    result[0] = tools.file(name);
    return result;
  }

  kj::String calls() { return readAll(tools.file("calls.log")); }
};

KJ_TEST("BundletoolExpander builds both APK Sets") {
  ExpanderFixture fixture;
  auto expander = fixture.makeExpander();

  auto split = expander.buildApkSet(fixture.bundle, ApkSetMode::SPLIT);
  KJ_EXPECT(split == fixture.workspace.file("app.apks"), split);
  KJ_EXPECT(fileExists(split));

  auto universal = expander.buildApkSet(fixture.bundle, ApkSetMode::UNIVERSAL);
  KJ_EXPECT(universal == fixture.workspace.file("universal.apks"), universal);
  KJ_EXPECT(fileExists(fixture.workspace.getKeystorePath()));

  auto lines = splitLines(fixture.calls());
  KJ_ASSERT(lines.size() == 3, fixture.calls());

  // The throwaway keystore is made once.
  KJ_EXPECT(lines[0].startsWith("keytool -genkeypair"), lines[0]);
  KJ_EXPECT(contains(lines[0], "-alias default"));
  KJ_EXPECT(contains(lines[0], "-storepass defaultpass"));

  KJ_EXPECT(lines[1] == kj::str(
      "bundletool build-apks --bundle ", fixture.bundle,
      " --output ", split,
      " --ks ", fixture.workspace.getKeystorePath(),
      " --ks-key-alias=default --ks-pass=pass:defaultpass"), lines[1]);
  KJ_EXPECT(lines[2].endsWith(" --mode=universal"), lines[2]);
}

KJ_TEST("BundletoolExpander replaces a stale archive") {
  ExpanderFixture fixture;
  auto expander = fixture.makeExpander();

  writeAll(fixture.workspace.file("app.apks"), "stale");
  auto split = expander.buildApkSet(fixture.bundle, ApkSetMode::SPLIT);
  KJ_EXPECT(readAll(split) == "archive\n");
}

KJ_TEST("BundletoolExpander keeps split and universal archives apart") {
  ExpanderFixture fixture;
  auto expander = fixture.makeExpander();

  auto bundle = fixture.tools.file("universal.aab");
  writeAll(bundle, "bundle");
  auto split = expander.buildApkSet(bundle, ApkSetMode::SPLIT);
  auto universal = expander.buildApkSet(bundle, ApkSetMode::UNIVERSAL);
  KJ_EXPECT(split != universal);
  KJ_EXPECT(fileExists(split));
  KJ_EXPECT(fileExists(universal));
}

KJ_TEST("BundletoolExpander failures") {
  {
    ExpanderFixture fixture(
        "echo 'Exception in thread \"main\" com.android.tools.build.bundletool.model."
        "exceptions.InvalidBundleException: Module base has no manifest.' >&2\n"
        "exit 1\n");
    auto expander = fixture.makeExpander();
    KJ_EXPECT(expectFailure([&]() {
      expander.buildApkSet(fixture.bundle, ApkSetMode::SPLIT);
    }) == ErrorKind::INVALID_BUNDLE);
  }

  {
    ExpanderFixture fixture("echo 'java.io.IOException: disk full' >&2\nexit 1\n");
    auto expander = fixture.makeExpander();
    KJ_EXPECT(expectFailure([&]() {
      expander.buildApkSet(fixture.bundle, ApkSetMode::UNIVERSAL);
    }) == ErrorKind::BUNDLE_IO);
  }

  {
    // Claims success but writes nothing.
    ExpanderFixture fixture("exit 0\n");
    auto expander = fixture.makeExpander();
    KJ_EXPECT(expectFailure([&]() {
      expander.buildApkSet(fixture.bundle, ApkSetMode::SPLIT);
    }) == ErrorKind::BUNDLE_IO);
  }

  {
    ExpanderFixture fixture(FAKE_BUNDLETOOL, "echo 'keytool error' >&2\nexit 1\n");
    auto expander = fixture.makeExpander();
    KJ_EXPECT(expectFailure([&]() {
      expander.buildApkSet(fixture.bundle, ApkSetMode::SPLIT);
    }) == ErrorKind::BUNDLE_IO);
  }
}

}  // namespace
}  // namespace bundlesigner
