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

#include "test-util.h"
#include "config.h"
#include "util.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <sys/stat.h>

namespace bundlesigner {

kj::String testTmpDir() {
  return defaultConfig().tmpDir;
}

void writeScript(kj::StringPtr path, kj::StringPtr body) {
  writeAll(path, kj::str("#!/bin/sh\n", body));
  KJ_SYSCALL(chmod(path.cStr(), 0755), path);
}

void makeZip(kj::StringPtr archive, kj::StringPtr stagingDir,
             kj::ArrayPtr<const kj::StringPtr> entries) {
  for (auto& entry: entries) {
    auto path = kj::str(stagingDir, "/", entry);
    recursivelyCreateParent(path);
    writeAll(path, kj::str("contents of ", entry));
  }

  auto output = absolutePath(archive);
  kj::Vector<kj::StringPtr> argv(entries.size() + 5);
  argv.add("zip");
  argv.add("-q");
  argv.add("-D");
  argv.add("-nw");
  argv.add(output);
  argv.addAll(entries);

  Subprocess::Options options(argv.asPtr());
  options.workingDirectory = stagingDir;
  Subprocess zip(kj::mv(options));
  zip.waitForSuccess();
}

ErrorKind expectFailure(kj::Function<void()> func) {
  try {
    func();
  } catch (const Failure& failure) {
    return failure.getKind();
  }
  KJ_FAIL_ASSERT("expected a Failure to be thrown");
}

// =======================================================================================

static kj::Array<kj::String> copyEntries(std::initializer_list<kj::StringPtr> entries) {
  auto builder = kj::heapArrayBuilder<kj::String>(entries.size());
  for (auto& entry: entries) {
    builder.add(kj::heapString(entry));
  }
  return builder.finish();
}

FakeExpander::FakeExpander(kj::StringPtr dir,
                           std::initializer_list<kj::StringPtr> splitEntries,
                           std::initializer_list<kj::StringPtr> universalEntries)
    : dir(kj::heapString(dir)),
      splitEntries(copyEntries(splitEntries)),
      universalEntries(copyEntries(universalEntries)) {}

kj::String FakeExpander::buildApkSet(kj::StringPtr bundle, ApkSetMode mode) {
  KJ_REQUIRE(fileExists(bundle), bundle);

  uint n = builds++;
  auto staging = kj::str(dir, "/staging", n);
  recursivelyCreateDirectory(staging);
  auto archive = kj::str(dir, "/set", n, ".apks");

  auto& entries = mode == ApkSetMode::SPLIT ? splitEntries : universalEntries;
  auto entryPtrs = KJ_MAP(entry, entries) -> kj::StringPtr { return entry; };
  makeZip(archive, staging, entryPtrs);
  return archive;
}

kj::String fakeV1Digest(kj::StringPtr content) {
  return kj::str("d1-", hexEncode(content.asArray().asBytes()));
}

kj::String fakeV2V3Digest(kj::StringPtr content) {
  return kj::str("d23-", hexEncode(content.asArray().asBytes()));
}

kj::String FakeSigner::computeV1Digest(kj::StringPtr apk, const DigestOptions& options) {
  ++v1Digests;
  lastMinSdkVersion = options.minSdkVersion;
  lastSignerCount = options.signers.size();
  return fakeV1Digest(readAll(apk));
}

void FakeSigner::embedV1Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                                  kj::StringPtr outputApk) {
  auto content = readAll(inputApk);
  BUNDLESIGNER_REQUIRE(payload == fakeV1Digest(content), SIGNER,
                       "V1 payload doesn't belong to ", inputApk);
  writeAll(outputApk, kj::str(content, "\nv1:", payload));
}

kj::String FakeSigner::computeV2V3Digest(kj::StringPtr v1SignedApk,
                                         const DigestOptions& options) {
  ++v2v3Digests;
  auto content = readAll(v1SignedApk);
  KJ_REQUIRE(contains(content, "\nv1:"), "APK isn't V1-signed", v1SignedApk);
  return fakeV2V3Digest(content);
}

void FakeSigner::embedV2V3Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                                    SchemeFlags flags, kj::StringPtr outputApk) {
  auto content = readAll(inputApk);
  BUNDLESIGNER_REQUIRE(payload == fakeV2V3Digest(content), SIGNER,
                       "V2/V3 payload doesn't belong to ", inputApk);
  embeddedFlags.add(flags);
  writeAll(outputApk, kj::str(content, "\nv2v3:", payload));
}

}  // namespace bundlesigner
