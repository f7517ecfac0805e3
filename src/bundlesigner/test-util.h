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

#ifndef BUNDLESIGNER_TEST_UTIL_H_
#define BUNDLESIGNER_TEST_UTIL_H_
// Helpers shared by the unit tests.

#include "bundle-expander.h"
#include "errors.h"
#include "signer.h"
#include <kj/string.h>
#include <kj/function.h>
#include <kj/vector.h>
#include <initializer_list>

namespace bundlesigner {

kj::String testTmpDir();
// Where tests create their workspaces.

void writeScript(kj::StringPtr path, kj::StringPtr body);
// Write an executable /bin/sh script.

void makeZip(kj::StringPtr archive, kj::StringPtr stagingDir,
             kj::ArrayPtr<const kj::StringPtr> entries);
// Create each entry under `stagingDir` (its content is "contents of <entry>") and zip them, in
// the given order, into `archive`.

ErrorKind expectFailure(kj::Function<void()> func);
// Run `func` and return the kind of the Failure it threw. Fails the test if `func` returns
// normally.

class FakeExpander final: public BundleExpander {
  // Produces APK Sets from fixed entry lists instead of running bundletool.

public:
  FakeExpander(kj::StringPtr dir, std::initializer_list<kj::StringPtr> splitEntries,
               std::initializer_list<kj::StringPtr> universalEntries);

  kj::String buildApkSet(kj::StringPtr bundle, ApkSetMode mode) override;

  uint builds = 0;

private:
  kj::String dir;
  kj::Array<kj::String> splitEntries;
  kj::Array<kj::String> universalEntries;
};

class FakeSigner final: public Signer {
  // Digests are hex dumps of the APK bytes; embedding appends the payload to the APK. Embedding
  // checks that the payload really belongs to the input, so pairing a variant with another
  // variant's digest fails with ErrorKind::SIGNER.

public:
  kj::String computeV1Digest(kj::StringPtr apk, const DigestOptions& options) override;
  void embedV1Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                        kj::StringPtr outputApk) override;
  kj::String computeV2V3Digest(kj::StringPtr v1SignedApk, const DigestOptions& options) override;
  void embedV2V3Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                          SchemeFlags flags, kj::StringPtr outputApk) override;

  uint v1Digests = 0;
  uint v2v3Digests = 0;
  kj::Maybe<uint> lastMinSdkVersion;
  size_t lastSignerCount = 0;
  kj::Vector<SchemeFlags> embeddedFlags;
};

kj::String fakeV1Digest(kj::StringPtr content);
kj::String fakeV2V3Digest(kj::StringPtr content);

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_TEST_UTIL_H_
