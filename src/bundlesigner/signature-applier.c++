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
#include "apk-set-walker.h"
#include "errors.h"
#include "util.h"
#include "workspace.h"
#include <kj/debug.h>

namespace bundlesigner {

SignatureApplier::SignatureApplier(Workspace& workspace, BundleExpander& expander,
                                   Signer& signer)
    : workspace(workspace), expander(expander), signer(signer) {}

kj::Array<kj::String> SignatureApplier::apply(
    kj::StringPtr bundle, kj::StringPtr transferPath, kj::StringPtr outputDir) {
  BUNDLESIGNER_REQUIRE(fileExists(transferPath), PARAMETER, "Passed Bin file does not exist");
  BUNDLESIGNER_REQUIRE(fileExists(bundle), PARAMETER, "Bundle file does not exist");

  auto transfer = readTransferFile(transferPath);
  return apply(bundle, transfer, outputDir);
}

kj::Array<kj::String> SignatureApplier::apply(
    kj::StringPtr bundle, const TransferFile& transfer, kj::StringPtr outputDir) {
  BUNDLESIGNER_REQUIRE(fileExists(bundle), PARAMETER, "Bundle file does not exist");

  auto bundleHash = transfer.getBundleHash();
  KJ_IF_MAYBE(recorded, bundleHash) {
    auto actual = computeBundleHash(bundle);
    BUNDLESIGNER_REQUIRE(actual == *recorded, CORRELATION,
        "transfer file was generated from a different bundle (recorded sha256 ", *recorded,
        ", ", bundle, " has ", actual, ")");
  }

  if (!isDirectory(outputDir)) {
    recursivelyCreateDirectory(outputDir);
  }

  std::set<kj::String> visited;
  std::set<kj::String> outputNames;
  kj::Vector<kj::String> results;

  auto splitSet = expander.buildApkSet(bundle, ApkSetMode::SPLIT);
  signApkSet(splitSet, workspace.freshDirectory("split"), transfer, outputDir,
             visited, outputNames, results);

  auto universalSet = expander.buildApkSet(bundle, ApkSetMode::UNIVERSAL);
  signApkSet(universalSet, workspace.freshDirectory("universal"), transfer, outputDir,
             visited, outputNames, results);

  if (visited.size() != transfer.size()) {
    kj::Vector<kj::StringPtr> unused;
    for (auto& variant: transfer.getVariants()) {
      if (visited.count(kj::heapString(variant.name)) == 0) {
        unused.add(variant.name);
      }
    }
    BUNDLESIGNER_FAIL(CORRELATION,
        "transfer file records variants this bundle did not produce: ",
        kj::strArray(unused.asPtr(), ", "));
  }

  auto archiveCopy = kj::str(outputDir, "/", leafName(bundle), ".apks");
  copyFile(splitSet, archiveCopy);
  KJ_LOG(INFO, "copied APK Set", archiveCopy);

  return results.releaseAsArray();
}

void SignatureApplier::signApkSet(
    kj::StringPtr archive, kj::StringPtr extractDir, const TransferFile& transfer,
    kj::StringPtr outputDir, std::set<kj::String>& visited,
    std::set<kj::String>& outputNames, kj::Vector<kj::String>& results) {
  auto flags = transfer.getFlags();
  ApkSetWalker walker(archive, extractDir);

  for (;;) {
    auto maybeVariant = walker.next();
    ExtractedVariant* variant;
    KJ_IF_MAYBE(v, maybeVariant) {
      variant = v;
    } else {
      break;
    }

    const VariantDigests* digests;
    KJ_IF_MAYBE(d, transfer.find(variant->name)) {
      digests = d;
    } else {
      BUNDLESIGNER_FAIL(CORRELATION, "no recorded digest for variant ", variant->name,
                        " (", variant->entryPath, " in ", archive, ")");
    }

    BUNDLESIGNER_REQUIRE(visited.insert(kj::heapString(variant->name)).second, CORRELATION,
        "variant ", variant->name, " was produced twice while rebuilding the bundle");

    auto outputName = outputNameForEntry(variant->entryPath);
    BUNDLESIGNER_REQUIRE(outputNames.insert(kj::heapString(outputName)).second, CORRELATION,
        "two variants would be written to the same file: ", outputName);
    auto output = kj::str(outputDir, "/", outputName);

    if (flags.needsV2V3Digest()) {
      auto& v2v3Payload = KJ_ASSERT_NONNULL(digests->v2v3,
          "transfer file lacks a V2/V3 digest", variant->name);
      auto v1Signed = workspace.file(kj::str("v1_", leafName(variant->path)));
      signer.embedV1Signature(variant->path, digests->v1, v1Signed);
      signer.embedV2V3Signature(v1Signed, v2v3Payload, flags, output);
    } else {
      signer.embedV1Signature(variant->path, digests->v1, output);
    }

    KJ_LOG(INFO, "signed APK", variant->name, output);
    results.add(kj::mv(output));
  }
}

}  // namespace bundlesigner
