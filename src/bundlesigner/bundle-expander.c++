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

#include "bundle-expander.h"
#include "errors.h"
#include "util.h"
#include "workspace.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <unistd.h>

namespace bundlesigner {

static constexpr const char* KEY_ALIAS = "default";
static constexpr const char* KEY_PASSWORD = "defaultpass";

BundleExpander::~BundleExpander() noexcept(false) {}

BundletoolExpander::BundletoolExpander(Workspace& workspace, kj::Array<kj::String> bundletool,
                                       kj::Array<kj::String> keytool)
    : workspace(workspace), bundletool(kj::mv(bundletool)), keytool(kj::mv(keytool)) {
  KJ_REQUIRE(this->bundletool.size() > 0, "bundletool command is empty");
  KJ_REQUIRE(this->keytool.size() > 0, "keytool command is empty");
}

kj::String BundletoolExpander::buildApkSet(kj::StringPtr bundle, ApkSetMode mode) {
  auto keystore = ensureKeystore();

  kj::String archiveName;
  if (mode == ApkSetMode::UNIVERSAL) {
    archiveName = kj::str("universal.apks");
  } else {
    auto base = stem(bundle);
    archiveName = base == "universal" ? kj::str(base, "-split.apks") : kj::str(base, ".apks");
  }
  auto output = workspace.file(archiveName);
  if (fileExists(output)) {
    // bundletool refuses to overwrite.
    KJ_SYSCALL(unlink(output.cStr()), output);
  }

  kj::Vector<kj::String> args;
  args.add(kj::str("build-apks"));
  args.add(kj::str("--bundle"));
  args.add(absolutePath(bundle));
  args.add(kj::str("--output"));
  args.add(kj::heapString(output));
  args.add(kj::str("--ks"));
  args.add(kj::mv(keystore));
  args.add(kj::str("--ks-key-alias=", KEY_ALIAS));
  args.add(kj::str("--ks-pass=pass:", KEY_PASSWORD));
  if (mode == ApkSetMode::UNIVERSAL) {
    args.add(kj::str("--mode=universal"));
  }

  kj::Vector<kj::StringPtr> argv(bundletool.size() + args.size());
  for (auto& part: bundletool) argv.add(part);
  for (auto& arg: args) argv.add(arg);

  KJ_LOG(INFO, "building APK Set", bundle, archiveName);
  auto result = runCommand(argv.asPtr());

  if (result.exitCode != 0) {
    BUNDLESIGNER_REQUIRE(!contains(result.output, "InvalidBundleException"), INVALID_BUNDLE,
        bundle, ": ", trim(result.output));
    BUNDLESIGNER_FAIL(BUNDLE_IO, "bundletool build-apks failed (exit code ", result.exitCode,
                      "): ", trim(result.output));
  }
  BUNDLESIGNER_REQUIRE(fileExists(output), BUNDLE_IO,
      "bundletool reported success but produced no APK Set: ", output);

  return output;
}

kj::String BundletoolExpander::ensureKeystore() {
  auto keystore = workspace.getKeystorePath();
  if (fileExists(keystore)) {
    return keystore;
  }

  kj::Vector<kj::StringPtr> argv(keytool.size() + 20);
  for (auto& part: keytool) argv.add(part);
  argv.addAll(std::initializer_list<kj::StringPtr>{
    "-genkeypair", "-noprompt",
    "-keystore", keystore,
    "-storepass", KEY_PASSWORD,
    "-keypass", KEY_PASSWORD,
    "-alias", KEY_ALIAS,
    "-keyalg", "RSA",
    "-keysize", "2048",
    "-validity", "10000",
    "-dname", "CN=Bundle Signer Throwaway Key"
  });

  auto result = runCommand(argv.asPtr());
  BUNDLESIGNER_REQUIRE(result.exitCode == 0 && fileExists(keystore), BUNDLE_IO,
      "could not create the intermediate keystore: ", trim(result.output));
  return keystore;
}

}  // namespace bundlesigner
