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

#include "signer.h"
#include "errors.h"
#include "util.h"

namespace bundlesigner {

Signer::~Signer() noexcept(false) {}

bool SignerConfig::isEmpty() const {
  return keystore == nullptr && keyAlias == nullptr && keystorePassword == nullptr &&
         keyPassword == nullptr && passwordEncoding == nullptr && v1SignerName == nullptr &&
         keystoreType == nullptr && providerName == nullptr && providerClass == nullptr &&
         providerArg == nullptr && keyFile == nullptr && certFile == nullptr;
}

kj::String SignerConfig::v1SignatureBasename() const {
  KJ_IF_MAYBE(n, v1SignerName) {
    return kj::heapString(*n);
  }
  KJ_IF_MAYBE(a, keyAlias) {
    return kj::heapString(*a);
  }
  KJ_IF_MAYBE(k, keyFile) {
    return stem(*k);
  }
  BUNDLESIGNER_FAIL(RUNTIME, name, ": Neither KeyStore key alias nor private key file available");
}

void SignerConfig::addArgs(kj::Vector<kj::String>& args) const {
  auto add = [&](kj::StringPtr flag, const kj::Maybe<kj::String>& value) {
    KJ_IF_MAYBE(v, value) {
      args.add(kj::heapString(flag));
      args.add(kj::heapString(*v));
    }
  };

  add("--ks", keystore);
  add("--ks-key-alias", keyAlias);
  add("--ks-pass", keystorePassword);
  add("--key-pass", keyPassword);
  add("--pass-encoding", passwordEncoding);
  add("--ks-type", keystoreType);
  add("--ks-provider-name", providerName);
  add("--ks-provider-class", providerClass);
  add("--ks-provider-arg", providerArg);
  add("--key", keyFile);
  add("--cert", certFile);

  args.add(kj::str("--v1-signer-name"));
  args.add(v1SignatureBasename());
}

}  // namespace bundlesigner
