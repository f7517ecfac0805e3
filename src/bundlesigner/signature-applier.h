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

#ifndef BUNDLESIGNER_SIGNATURE_APPLIER_H_
#define BUNDLESIGNER_SIGNATURE_APPLIER_H_

#include "bundle-expander.h"
#include "signer.h"
#include "transfer-file.h"
#include <kj/array.h>
#include <set>

namespace bundlesigner {

class Workspace;

class SignatureApplier {
  // Second phase: rebuilds the same APK Sets, pairs every variant with the digests recorded for
  // it, and has the Signer embed the signatures. The scheme flags come from the transfer file.
  //
  // Every variant rebuilt must have exactly one record and every record must be used; anything
  // else means the bundle (or the tooling) changed between the phases.

public:
  SignatureApplier(Workspace& workspace, BundleExpander& expander, Signer& signer);
  KJ_DISALLOW_COPY(SignatureApplier);

  kj::Array<kj::String> apply(kj::StringPtr bundle, kj::StringPtr transferPath,
                              kj::StringPtr outputDir);
  kj::Array<kj::String> apply(kj::StringPtr bundle, const TransferFile& transfer,
                              kj::StringPtr outputDir);
  // Returns the signed APKs in the order they were written. The split APK Set itself is copied to
  // `<outputDir>/<bundle file name>.apks`. Files already written stay in place if a later
  // variant fails.

private:
  Workspace& workspace;
  BundleExpander& expander;
  Signer& signer;

  void signApkSet(kj::StringPtr archive, kj::StringPtr extractDir, const TransferFile& transfer,
                  kj::StringPtr outputDir, std::set<kj::String>& visited,
                  std::set<kj::String>& outputNames, kj::Vector<kj::String>& results);
};

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_SIGNATURE_APPLIER_H_
