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
#include "test-util.h"
#include <kj/test.h>

namespace bundlesigner {
namespace {

kj::String joinArgs(const kj::Vector<kj::String>& args) {
  return kj::strArray(args.asPtr(), " ");
}

KJ_TEST("SignerConfig emptiness") {
  SignerConfig config;
  config.name = kj::str("signer #1");
  KJ_EXPECT(config.isEmpty());

  config.certFile = kj::str("cert.pem");
  KJ_EXPECT(!config.isEmpty());
}

KJ_TEST("V1 signature basename") {
  SignerConfig config;
  config.name = kj::str("signer #1");
  config.keyFile = kj::str("/keys/release.pk8");
  KJ_EXPECT(config.v1SignatureBasename() == "release");

  config.keyAlias = kj::str("upload");
  KJ_EXPECT(config.v1SignatureBasename() == "upload");

  config.v1SignerName = kj::str("CERT");
  KJ_EXPECT(config.v1SignatureBasename() == "CERT");

  SignerConfig keystoreOnly;
  keystoreOnly.name = kj::str("signer #2");
  keystoreOnly.keystore = kj::str("release.jks");
  KJ_EXPECT(expectFailure([&]() { keystoreOnly.v1SignatureBasename(); }) ==
            ErrorKind::RUNTIME);
}

KJ_TEST("SignerConfig command-line form") {
  SignerConfig config;
  config.name = kj::str("signer #1");
  config.keystore = kj::str("release.jks");
  config.keyAlias = kj::str("release");
  config.keystorePassword = kj::str("env:KS_PASS");

  kj::Vector<kj::String> args;
  config.addArgs(args);
  KJ_EXPECT(joinArgs(args) ==
      "--ks release.jks --ks-key-alias release --ks-pass env:KS_PASS "
      "--v1-signer-name release", joinArgs(args));
}

}  // namespace
}  // namespace bundlesigner
