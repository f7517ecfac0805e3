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

#include "signature-applier.h"
#include "digest-recorder.h"
#include "test-util.h"
#include "util.h"
#include "workspace.h"
#include <kj/test.h>

namespace bundlesigner {
namespace {

struct ApplierFixture {
  // Runs the first phase in its own workspace, the way genbin and signbundle run in separate
  // processes.

  Workspace scratch;
  kj::String bundle;
  kj::String outputDir;
  kj::Array<SignerConfig> signers;
  uint expanderCount = 0;

  ApplierFixture()
      : scratch(testTmpDir()),
        bundle(scratch.file("app.aab")),
        outputDir(scratch.file("signed")),
        signers(kj::heapArray<SignerConfig>(1)) {
    writeAll(bundle, "bundle bytes");
    signers[0].name = kj::str("signer #1");
    signers[0].keystore = kj::str("release.jks");
  }

  kj::String setsDir() {
    return scratch.freshDirectory(kj::str("sets", expanderCount++));
  }

  TransferFile record(std::initializer_list<kj::StringPtr> splitEntries,
                      std::initializer_list<kj::StringPtr> universalEntries,
                      SchemeFlags flags, bool bindBundle = false) {
    Workspace workspace(testTmpDir());
    FakeExpander expander(setsDir(), splitEntries, universalEntries);
    FakeSigner signer;
    DigestRecorder recorder(workspace, expander, signer);
    recorder.setBindBundle(bindBundle);
    return recorder.generate(bundle, signers, flags, nullptr);
  }
};

SchemeFlags v2Flags() {
  SchemeFlags flags;
  flags.v2 = true;
  return flags;
}

KJ_TEST("SignatureApplier signs every rebuilt variant") {
  ApplierFixture fixture;
  auto transfer = fixture.record({"toc.pb", "arm64-v8a/base.apk", "x86/base.apk"},
                                 {"toc.pb", "universal.apk"}, v2Flags());

  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(),
      {"toc.pb", "arm64-v8a/base.apk", "x86/base.apk"}, {"toc.pb", "universal.apk"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  auto results = applier.apply(fixture.bundle, transfer, fixture.outputDir);

  KJ_ASSERT(results.size() == 3);
  KJ_EXPECT(results[0] == kj::str(fixture.outputDir, "/arm64-v8a_base.apk"));
  KJ_EXPECT(results[1] == kj::str(fixture.outputDir, "/x86_base.apk"));
  KJ_EXPECT(results[2] == kj::str(fixture.outputDir, "/universal.apk"));

  auto signedApk = readAll(results[1]);
  KJ_EXPECT(signedApk.startsWith("contents of x86/base.apk\nv1:d1-"), signedApk);
  KJ_EXPECT(contains(signedApk, "\nv2v3:d23-"), signedApk);

  KJ_EXPECT(fileExists(kj::str(fixture.outputDir, "/app.aab.apks")));
  KJ_EXPECT(expander.builds == 2);

  KJ_ASSERT(signer.embeddedFlags.size() == 3);
  for (auto& flags: signer.embeddedFlags) {
    KJ_EXPECT(flags == v2Flags());
  }
}

KJ_TEST("SignatureApplier takes the scheme flags from the transfer file") {
  ApplierFixture fixture;
  SchemeFlags flags;
  flags.v3 = true;
  auto transfer = fixture.record({"toc.pb", "splits/base-master.apk"},
                                 {"toc.pb", "universal.apk"}, flags);
  auto transferPath = fixture.scratch.file("app.bin");
  writeTransferFile(transferPath, transfer);

  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(),
      {"toc.pb", "splits/base-master.apk"}, {"toc.pb", "universal.apk"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  auto results = applier.apply(fixture.bundle, transferPath, fixture.outputDir);
  KJ_EXPECT(results.size() == 2);

  KJ_ASSERT(signer.embeddedFlags.size() == 2);
  KJ_EXPECT(!signer.embeddedFlags[0].v2);
  KJ_EXPECT(signer.embeddedFlags[0].v3);
}

KJ_TEST("SignatureApplier with V1 only") {
  ApplierFixture fixture;
  auto transfer = fixture.record({"toc.pb", "splits/base-master.apk"},
                                 {"toc.pb", "universal.apk"}, SchemeFlags());

  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(),
      {"toc.pb", "splits/base-master.apk"}, {"toc.pb", "universal.apk"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  auto results = applier.apply(fixture.bundle, transfer, fixture.outputDir);
  KJ_ASSERT(results.size() == 2);
  KJ_EXPECT(results[0] == kj::str(fixture.outputDir, "/splits_base-master.apk"));

  KJ_EXPECT(readAll(results[1]) ==
      kj::str("contents of universal.apk\nv1:", fakeV1Digest("contents of universal.apk")));
  KJ_EXPECT(signer.embeddedFlags.size() == 0);
}

KJ_TEST("SignatureApplier rejects a variant with no recorded digest") {
  ApplierFixture fixture;
  auto transfer = fixture.record({"toc.pb", "arm64-v8a/base.apk"},
                                 {"toc.pb", "universal.apk"}, v2Flags());

  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(),
      {"toc.pb", "arm64-v8a/base.apk", "x86/base.apk"}, {"toc.pb", "universal.apk"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  KJ_EXPECT(expectFailure([&]() {
    applier.apply(fixture.bundle, transfer, fixture.outputDir);
  }) == ErrorKind::CORRELATION);
}

KJ_TEST("SignatureApplier rejects records the bundle no longer produces") {
  ApplierFixture fixture;
  auto transfer = fixture.record({"toc.pb", "arm64-v8a/base.apk", "x86/base.apk"},
                                 {"toc.pb", "universal.apk"}, v2Flags());

  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(),
      {"toc.pb", "arm64-v8a/base.apk"}, {"toc.pb", "universal.apk"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  KJ_EXPECT(expectFailure([&]() {
    applier.apply(fixture.bundle, transfer, fixture.outputDir);
  }) == ErrorKind::CORRELATION);
  KJ_EXPECT(!fileExists(kj::str(fixture.outputDir, "/app.aab.apks")));
}

KJ_TEST("SignatureApplier rejects a variant rebuilt in both APK Sets") {
  ApplierFixture fixture;
  auto transfer = fixture.record({"toc.pb", "universal.apk"}, {"toc.pb"}, SchemeFlags());

  // The rebuild now also yields universal.apk from the universal set.
  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(),
      {"toc.pb", "universal.apk"}, {"toc.pb", "universal.apk"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  KJ_EXPECT(expectFailure([&]() {
    applier.apply(fixture.bundle, transfer, fixture.outputDir);
  }) == ErrorKind::CORRELATION);

  auto written = listDirectory(fixture.outputDir);
  KJ_ASSERT(written.size() == 1);
  KJ_EXPECT(written[0] == "universal.apk");
}

KJ_TEST("SignatureApplier refuses to write two variants to one file") {
  ApplierFixture fixture;
  // Distinct variant names, same output name.
  auto transfer = fixture.record({"toc.pb", "splits/nested/base.apk", "nested/base.apk"},
                                 {"toc.pb", "universal.apk"}, SchemeFlags());

  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(),
      {"toc.pb", "splits/nested/base.apk", "nested/base.apk"}, {"toc.pb", "universal.apk"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  KJ_EXPECT(expectFailure([&]() {
    applier.apply(fixture.bundle, transfer, fixture.outputDir);
  }) == ErrorKind::CORRELATION);
}

KJ_TEST("SignatureApplier checks the bundle hash when one was recorded") {
  ApplierFixture fixture;
  auto transfer = fixture.record({"toc.pb", "splits/base-master.apk"},
                                 {"toc.pb", "universal.apk"}, SchemeFlags(), true);
  writeAll(fixture.bundle, "a different build");

  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(),
      {"toc.pb", "splits/base-master.apk"}, {"toc.pb", "universal.apk"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  KJ_EXPECT(expectFailure([&]() {
    applier.apply(fixture.bundle, transfer, fixture.outputDir);
  }) == ErrorKind::CORRELATION);
  KJ_EXPECT(expander.builds == 0);
}

KJ_TEST("SignatureApplier requires both inputs to exist") {
  ApplierFixture fixture;
  auto transferPath = fixture.scratch.file("app.bin");
  writeTransferFile(transferPath, TransferFile(SchemeFlags()));

  Workspace workspace(testTmpDir());
  FakeExpander expander(fixture.setsDir(), {"toc.pb"}, {"toc.pb"});
  FakeSigner signer;
  SignatureApplier applier(workspace, expander, signer);

  KJ_EXPECT(expectFailure([&]() {
    applier.apply(fixture.bundle, fixture.scratch.file("missing.bin"), fixture.outputDir);
  }) == ErrorKind::PARAMETER);

  KJ_EXPECT(expectFailure([&]() {
    applier.apply(fixture.scratch.file("missing.aab"), transferPath, fixture.outputDir);
  }) == ErrorKind::PARAMETER);

  KJ_EXPECT(expander.builds == 0);
}

}  // namespace
}  // namespace bundlesigner
