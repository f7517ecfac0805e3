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

#ifndef BUNDLESIGNER_SIGNER_H_
#define BUNDLESIGNER_SIGNER_H_

#include "transfer-file.h"
#include <kj/string.h>
#include <kj/vector.h>

namespace bundlesigner {

typedef unsigned int uint;

struct SignerConfig {
  // Signer selection as given on the command line. The values are handed to the signing
  // implementation untouched; we never open keystores ourselves.

  kj::String name;
  // "signer #1", "signer #2", ...

  kj::Maybe<kj::String> keystore;            // --ks
  kj::Maybe<kj::String> keyAlias;            // --ks-key-alias
  kj::Maybe<kj::String> keystorePassword;    // --ks-pass
  kj::Maybe<kj::String> keyPassword;         // --key-pass
  kj::Maybe<kj::String> passwordEncoding;    // --pass-encoding
  kj::Maybe<kj::String> v1SignerName;        // --v1-signer-name
  kj::Maybe<kj::String> keystoreType;        // --ks-type
  kj::Maybe<kj::String> providerName;        // --ks-provider-name
  kj::Maybe<kj::String> providerClass;       // --ks-provider-class
  kj::Maybe<kj::String> providerArg;         // --ks-provider-arg
  kj::Maybe<kj::String> keyFile;             // --key
  kj::Maybe<kj::String> certFile;            // --cert

  bool isEmpty() const;

  kj::String v1SignatureBasename() const;
  // Base name of the META-INF signature files: --v1-signer-name if given, else the key alias,
  // else the private key's file name up to its first '.'.

  void addArgs(kj::Vector<kj::String>& args) const;
  // Append the options that were set, in command-line form.
};

struct DigestOptions {
  SchemeFlags flags;
  kj::Maybe<uint> minSdkVersion;
  bool debuggableApkPermitted = true;
  kj::ArrayPtr<const SignerConfig> signers;
};

class Signer {
  // The cryptographic half of signing. Digests are opaque single-line payloads to us; whatever the
  // implementation returns from a compute*() call is what it gets back in the matching embed*()
  // call during the other phase.

public:
  virtual ~Signer() noexcept(false);

  virtual kj::String computeV1Digest(kj::StringPtr apk, const DigestOptions& options) = 0;

  virtual void embedV1Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                                kj::StringPtr outputApk) = 0;

  virtual kj::String computeV2V3Digest(kj::StringPtr v1SignedApk,
                                       const DigestOptions& options) = 0;
  // `v1SignedApk` must already carry its V1 signature since the APK Signing Block digest covers
  // the META-INF entries.

  virtual void embedV2V3Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                                  SchemeFlags flags, kj::StringPtr outputApk) = 0;
};

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_SIGNER_H_
