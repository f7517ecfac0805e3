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

#include "digest-recorder.h"
#include "test-util.h"
#include "util.h"
#include "workspace.h"
#include <kj/test.h>

namespace bundlesigner {
namespace {

struct RecorderFixture {
  Workspace scratch;
  Workspace workspace;
  FakeSigner signer;
  kj::String bundle;
  kj::Array<SignerConfig> signers;

  RecorderFixture()
      : scratch(testTmpDir()), workspace(testTmpDir()),
        bundle(scratch.file("app.aab")),
        signers(kj::heapArray<SignerConfig>(1)) {
    writeAll(bundle, "bundle bytes");
    signers[0].name = kj::str("signer #1");
    signers[0].keystore = kj::str("release.jks");
  }
};

KJ_TEST("DigestRecorder records one V1 payload per variant") {
  RecorderFixture fixture;
  FakeExpander expander(fixture.scratch.freshDirectory("sets"),
      {"toc.pb", "splits/base-master.apk"}, {"toc.pb", "universal.apk"});
  DigestRecorder recorder(fixture.workspace, expander, fixture.signer);

  auto result = recorder.generate(fixture.bundle, fixture.signers, SchemeFlags(), 21u);

  KJ_EXPECT(expander.builds == 2);
  KJ_EXPECT(result.getFlags() == SchemeFlags());
  KJ_EXPECT(result.getBundleHash() == nullptr);

  auto variants = result.getVariants();
  KJ_ASSERT(variants.size() == 2);
  KJ_EXPECT(variants[0].name == "splits_base-master.apk");
  KJ_EXPECT(variants[0].v1 == fakeV1Digest("contents of splits/base-master.apk"));
  KJ_EXPECT(variants[0].v2v3 == nullptr);
  KJ_EXPECT(variants[1].name == "universal.apk");
  KJ_EXPECT(variants[1].v1 == fakeV1Digest("contents of universal.apk"));

  KJ_EXPECT(fixture.signer.v1Digests == 2);
  KJ_EXPECT(fixture.signer.v2v3Digests == 0);
  KJ_EXPECT(KJ_ASSERT_NONNULL(fixture.signer.lastMinSdkVersion) == 21);
  KJ_EXPECT(fixture.signer.lastSignerCount == 1);
}

KJ_TEST("DigestRecorder takes V2/V3 digests over the V1-signed APK") {
  RecorderFixture fixture;
  FakeExpander expander(fixture.scratch.freshDirectory("sets"),
      {"toc.pb", "arm64-v8a/base.apk", "x86/base.apk"}, {"toc.pb", "universal.apk"});
  DigestRecorder recorder(fixture.workspace, expander, fixture.signer);

  SchemeFlags flags;
  flags.v2 = true;
  auto result = recorder.generate(fixture.bundle, fixture.signers, flags, nullptr);

  KJ_EXPECT(result.getFlags() == flags);
  auto variants = result.getVariants();
  KJ_ASSERT(variants.size() == 3);
  KJ_EXPECT(variants[0].name == "arm64-v8a_base.apk");
  KJ_EXPECT(variants[1].name == "x86_base.apk");
  KJ_EXPECT(variants[2].name == "universal.apk");

  for (auto& variant: variants) {
    KJ_IF_MAYBE(v2v3, variant.v2v3) {
      KJ_EXPECT(v2v3->startsWith("d23-"), *v2v3);
    } else {
      KJ_FAIL_EXPECT("missing V2/V3 payload", variant.name);
    }
  }

  auto expected = fakeV2V3Digest(kj::str("contents of x86/base.apk\nv1:",
                                         fakeV1Digest("contents of x86/base.apk")));
  KJ_EXPECT(KJ_ASSERT_NONNULL(variants[1].v2v3) == expected);
  KJ_EXPECT(fixture.signer.v2v3Digests == 3);
  KJ_EXPECT(fixture.signer.lastMinSdkVersion == nullptr);
}

KJ_TEST("DigestRecorder discards logs from an earlier run") {
  RecorderFixture fixture;
  writeAll(fixture.workspace.getV1LogPath(), "stale.apk\nd1-00\n");
  writeAll(fixture.workspace.getV2V3LogPath(), "stale.apk\nd23-00\n");

  FakeExpander expander(fixture.scratch.freshDirectory("sets"),
      {"toc.pb", "splits/base-master.apk"}, {"toc.pb", "universal.apk"});
  DigestRecorder recorder(fixture.workspace, expander, fixture.signer);

  SchemeFlags flags;
  flags.v3 = true;
  auto result = recorder.generate(fixture.bundle, fixture.signers, flags, nullptr);
  KJ_EXPECT(result.size() == 2);
  KJ_EXPECT(result.find("stale.apk") == nullptr);
}

KJ_TEST("DigestRecorder can bind the transfer file to the bundle") {
  RecorderFixture fixture;
  FakeExpander expander(fixture.scratch.freshDirectory("sets"),
      {"toc.pb", "splits/base-master.apk"}, {"toc.pb", "universal.apk"});
  DigestRecorder recorder(fixture.workspace, expander, fixture.signer);
  recorder.setBindBundle(true);

  auto result = recorder.generate(fixture.bundle, fixture.signers, SchemeFlags(), nullptr);
  auto hash = result.getBundleHash();
  KJ_EXPECT(KJ_ASSERT_NONNULL(hash) == computeBundleHash(fixture.bundle));
}

KJ_TEST("DigestRecorder rejects bad input before building anything") {
  RecorderFixture fixture;
  FakeExpander expander(fixture.scratch.freshDirectory("sets"),
      {"toc.pb", "splits/base-master.apk"}, {"toc.pb", "universal.apk"});
  DigestRecorder recorder(fixture.workspace, expander, fixture.signer);

  KJ_EXPECT(expectFailure([&]() {
    recorder.generate(fixture.bundle, nullptr, SchemeFlags(), nullptr);
  }) == ErrorKind::PARAMETER);

  KJ_EXPECT(expectFailure([&]() {
    recorder.generate(fixture.scratch.file("missing.aab"), fixture.signers, SchemeFlags(),
                      nullptr);
  }) == ErrorKind::PARAMETER);

  KJ_EXPECT(expander.builds == 0);
}

KJ_TEST("DigestRecorder rejects variants that share a name") {
  RecorderFixture fixture;
  // The universal APK also shows up in the split set.
  FakeExpander expander(fixture.scratch.freshDirectory("sets"),
      {"toc.pb", "universal.apk"}, {"toc.pb", "universal.apk"});
  DigestRecorder recorder(fixture.workspace, expander, fixture.signer);

  KJ_EXPECT(expectFailure([&]() {
    recorder.generate(fixture.bundle, fixture.signers, SchemeFlags(), nullptr);
  }) == ErrorKind::CORRELATION);
}

}  // namespace
}  // namespace bundlesigner
