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

#include "apk-set-walker.h"
#include "test-util.h"
#include "util.h"
#include "workspace.h"
#include <kj/test.h>
#include <kj/vector.h>

namespace bundlesigner {
namespace {

kj::Array<ExtractedVariant> walkAll(kj::StringPtr archive, kj::StringPtr workDir) {
  ApkSetWalker walker(archive, workDir);
  kj::Vector<ExtractedVariant> result;
  for (;;) {
    auto next = walker.next();
    KJ_IF_MAYBE(variant, next) {
      result.add(kj::mv(*variant));
    } else {
      break;
    }
  }

  // Exhausted walks stay exhausted.
  KJ_EXPECT(walker.next() == nullptr);
  return result.releaseAsArray();
}

KJ_TEST("entry naming") {
  KJ_EXPECT(isApkEntry("splits/base-master.apk"));
  KJ_EXPECT(isApkEntry("universal.apk"));
  KJ_EXPECT(!isApkEntry("toc.pb"));
  KJ_EXPECT(!isApkEntry("splits.apk/"));

  KJ_EXPECT(variantNameForEntry("splits/base-master.apk") == "splits_base-master.apk");
  KJ_EXPECT(variantNameForEntry("universal.apk") == "universal.apk");
  KJ_EXPECT(variantNameForEntry("a/b.apk.idsig") == "a_b.apk");

  KJ_EXPECT(outputNameForEntry("arm64-v8a/base.apk") == "arm64-v8a_base.apk");
  KJ_EXPECT(outputNameForEntry("splits/nested/base-xxhdpi.apk") == "nested_base-xxhdpi.apk");
  KJ_EXPECT(outputNameForEntry("universal.apk") == "universal.apk");
  KJ_EXPECT(outputNameForEntry("standalones/universal-x86.apk") == "universal-x86.apk");
  KJ_EXPECT(outputNameForEntry("base.apk") == "base.apk");
}

KJ_TEST("walk an APK Set") {
  Workspace dir(testTmpDir());
  auto archive = dir.file("app.apks");
  kj::StringPtr entries[] = {
    "toc.pb",
    "splits/base-master.apk",
    "arm64-v8a/base.apk",
    "x86/base.apk",
  };
  makeZip(archive, dir.freshDirectory("staging"), entries);

  auto workDir = dir.freshDirectory("split");
  auto variants = walkAll(archive, workDir);

  KJ_ASSERT(variants.size() == 3);
  KJ_EXPECT(variants[0].entryPath == "splits/base-master.apk");
  KJ_EXPECT(variants[0].name == "splits_base-master.apk");
  KJ_EXPECT(variants[1].name == "arm64-v8a_base.apk");
  KJ_EXPECT(variants[2].name == "x86_base.apk");

  // Same-named leaves from different configurations land in different files.
  KJ_EXPECT(variants[1].path == kj::str(workDir, "/arm64-v8a/base.apk"));
  KJ_EXPECT(variants[2].path == kj::str(workDir, "/x86/base.apk"));
  KJ_EXPECT(readAll(variants[1].path) == "contents of arm64-v8a/base.apk");
  KJ_EXPECT(readAll(variants[2].path) == "contents of x86/base.apk");

  // Non-APK entries are never extracted.
  KJ_EXPECT(!fileExists(kj::str(workDir, "/toc.pb")));
}

KJ_TEST("walk extracts names containing pattern characters literally") {
  Workspace dir(testTmpDir());
  auto archive = dir.file("odd.apks");
  kj::StringPtr entries[] = {
    "splits/base[x].apk", "splits/basex.apk", "splits/a\\b*?.apk"
  };
  makeZip(archive, dir.freshDirectory("staging"), entries);

  auto variants = walkAll(archive, dir.freshDirectory("out"));
  KJ_ASSERT(variants.size() == 3);
  KJ_EXPECT(variants[0].name == "splits_base[x].apk");
  KJ_EXPECT(readAll(variants[0].path) == "contents of splits/base[x].apk");
  KJ_EXPECT(readAll(variants[1].path) == "contents of splits/basex.apk");
  KJ_EXPECT(variants[2].name == "splits_a\\b*?.apk");
  KJ_EXPECT(readAll(variants[2].path) == "contents of splits/a\\b*?.apk");
}

KJ_TEST("archive without APKs") {
  Workspace dir(testTmpDir());
  auto archive = dir.file("empty.apks");
  kj::StringPtr entries[] = { "toc.pb" };
  makeZip(archive, dir.freshDirectory("staging"), entries);

  KJ_EXPECT(walkAll(archive, dir.freshDirectory("out")).size() == 0);
}

KJ_TEST("unreadable archives are I/O errors") {
  Workspace dir(testTmpDir());
  auto workDir = dir.freshDirectory("out");

  KJ_EXPECT(expectFailure([&]() {
    ApkSetWalker walker(dir.file("missing.apks"), workDir);
    walker.next();
  }) == ErrorKind::IO);

  auto garbage = dir.file("garbage.apks");
  writeAll(garbage, "this is not a zip file");
  KJ_EXPECT(expectFailure([&]() {
    ApkSetWalker walker(garbage, workDir);
    walker.next();
  }) == ErrorKind::IO);
}

}  // namespace
}  // namespace bundlesigner
