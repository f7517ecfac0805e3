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
#include "apk-set-walker.h"
#include "errors.h"
#include "util.h"
#include "workspace.h"
#include <kj/debug.h>
#include <unistd.h>

namespace bundlesigner {

DigestRecorder::DigestRecorder(Workspace& workspace, BundleExpander& expander, Signer& signer)
    : workspace(workspace), expander(expander), signer(signer) {}

TransferFile DigestRecorder::generate(
    kj::StringPtr bundle, kj::ArrayPtr<const SignerConfig> signers, SchemeFlags flags,
    kj::Maybe<uint> minSdkVersion, bool debuggableApkPermitted) {
  BUNDLESIGNER_REQUIRE(signers.size() > 0, PARAMETER, "At least one signer must be specified");
  BUNDLESIGNER_REQUIRE(fileExists(bundle), PARAMETER, "Input bundle file does not exist");

  DigestOptions options;
  options.flags = flags;
  options.minSdkVersion = minSdkVersion;
  options.debuggableApkPermitted = debuggableApkPermitted;
  options.signers = signers;

  // The logs are appended to, so anything left by an earlier run in this workspace must go.
  auto v1Log = workspace.getV1LogPath();
  auto v2v3Log = workspace.getV2V3LogPath();
  for (auto& log: { kj::StringPtr(v1Log), kj::StringPtr(v2v3Log) }) {
    if (fileExists(log)) {
      KJ_SYSCALL(unlink(log.cStr()), log);
    }
  }

  std::set<kj::String> seen;

  auto splitSet = expander.buildApkSet(bundle, ApkSetMode::SPLIT);
  recordApkSet(splitSet, workspace.freshDirectory("split"), options, seen);

  auto universalSet = expander.buildApkSet(bundle, ApkSetMode::UNIVERSAL);
  recordApkSet(universalSet, workspace.freshDirectory("universal"), options, seen);

  kj::Maybe<kj::StringPtr> v2v3LogPath;
  if (flags.needsV2V3Digest()) {
    v2v3LogPath = kj::StringPtr(v2v3Log);
  }
  auto result = mergeDigestLogs(flags, v1Log, v2v3LogPath);

  if (bindBundle) {
    result.setBundleHash(computeBundleHash(bundle));
  }

  KJ_LOG(INFO, "recorded digests", bundle, result.size(), flags);
  return result;
}

void DigestRecorder::recordApkSet(kj::StringPtr archive, kj::StringPtr extractDir,
                                  const DigestOptions& options, std::set<kj::String>& seen) {
  ApkSetWalker walker(archive, extractDir);

  for (;;) {
    auto maybeVariant = walker.next();
    ExtractedVariant* variant;
    KJ_IF_MAYBE(v, maybeVariant) {
      variant = v;
    } else {
      break;
    }

    BUNDLESIGNER_REQUIRE(seen.insert(kj::heapString(variant->name)).second, CORRELATION,
        "two APK variants normalize to the same name: ", variant->name,
        " (", variant->entryPath, " in ", archive, ")");

    auto v1Digest = signer.computeV1Digest(variant->path, options);
    appendDigestGroup(workspace.getV1LogPath(), variant->name, v1Digest);

    if (options.flags.needsV2V3Digest()) {
      // The V2/V3 digest covers the META-INF entries, so it is taken over a V1-signed copy.
      auto v1Signed = workspace.file(kj::str("out_", variant->name));
      signer.embedV1Signature(variant->path, v1Digest, v1Signed);
      auto v2v3Digest = signer.computeV2V3Digest(v1Signed, options);
      appendDigestGroup(workspace.getV2V3LogPath(), variant->name, v2v3Digest);
    }

    KJ_LOG(INFO, "recorded digest", variant->name);
  }
}

}  // namespace bundlesigner
