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

#ifndef BUNDLESIGNER_BUNDLE_EXPANDER_H_
#define BUNDLESIGNER_BUNDLE_EXPANDER_H_

#include <kj/string.h>
#include <kj/array.h>

namespace bundlesigner {

class Workspace;

enum class ApkSetMode {
  SPLIT,
  // Device-configuration-specific APKs.

  UNIVERSAL
  // A single APK containing everything.
};

class BundleExpander {
  // Turns an App Bundle into an APK Set archive. The archive's entries are pre-signed with a
  // throwaway key so that they are structurally valid APKs; the real signatures replace those.

public:
  virtual ~BundleExpander() noexcept(false);

  virtual kj::String buildApkSet(kj::StringPtr bundle, ApkSetMode mode) = 0;
  // Returns the path of the freshly built archive.
};

class BundletoolExpander final: public BundleExpander {
  // Runs `bundletool build-apks`. The throwaway keystore is made with `keytool` the first time
  // it's needed and lives in the workspace.

public:
  BundletoolExpander(Workspace& workspace, kj::Array<kj::String> bundletool,
                     kj::Array<kj::String> keytool);

  kj::String buildApkSet(kj::StringPtr bundle, ApkSetMode mode) override;

private:
  Workspace& workspace;
  kj::Array<kj::String> bundletool;
  kj::Array<kj::String> keytool;

  kj::String ensureKeystore();
};

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_BUNDLE_EXPANDER_H_
