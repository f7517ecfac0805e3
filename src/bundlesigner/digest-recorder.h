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

#ifndef BUNDLESIGNER_DIGEST_RECORDER_H_
#define BUNDLESIGNER_DIGEST_RECORDER_H_

#include "bundle-expander.h"
#include "signer.h"
#include "transfer-file.h"
#include <set>

namespace bundlesigner {

class Workspace;

class DigestRecorder {
  // First phase: expands the bundle into its split and universal APK Sets and records the
  // pre-signature content digests of every variant. Needs no private key material.

public:
  DigestRecorder(Workspace& workspace, BundleExpander& expander, Signer& signer);
  KJ_DISALLOW_COPY(DigestRecorder);

  void setBindBundle(bool bind) { bindBundle = bind; }
  // Record the bundle's SHA-256 in the flags line so that signbundle can refuse a different
  // bundle build.

  TransferFile generate(kj::StringPtr bundle, kj::ArrayPtr<const SignerConfig> signers,
                        SchemeFlags flags, kj::Maybe<uint> minSdkVersion,
                        bool debuggableApkPermitted = true);
  // Split variants come first, then universal ones. Any failure aborts the whole run.

private:
  Workspace& workspace;
  BundleExpander& expander;
  Signer& signer;
  bool bindBundle = false;

  void recordApkSet(kj::StringPtr archive, kj::StringPtr extractDir,
                    const DigestOptions& options, std::set<kj::String>& seen);
};

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_DIGEST_RECORDER_H_
