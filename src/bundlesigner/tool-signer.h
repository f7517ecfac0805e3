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

#ifndef BUNDLESIGNER_TOOL_SIGNER_H_
#define BUNDLESIGNER_TOOL_SIGNER_H_

#include "signer.h"
#include <kj/array.h>

namespace bundlesigner {

class ToolSigner final: public Signer {
  // Signer that runs an external detached-signing helper, one process per operation:
  //
  //     <tool> digest-v1   --in <apk> --bin <bin> [digest options] <signer options>...
  //     <tool> sign-v1     --in <apk> --bin <bin> --out <apk>
  //     <tool> digest-v2v3 --in <apk> --bin <bin> [digest options] <signer options>...
  //     <tool> sign-v2v3   --in <apk> --bin <bin> --out <apk> --v2-signing-enabled <bool>
  //                        --v3-signing-enabled <bool>
  //
  // A bin file is two lines: the APK path, then the payload. digest-* commands write it and
  // sign-* commands read it. Several signers are separated by --next-signer. Exit code 3 means
  // the minimum SDK version couldn't be determined and 7 means the APK is malformed.
  //
  // A `pass:<password>` given for --ks-pass or --key-pass is written to a private file next to
  // the bin file and handed over as `file:<path>`, which the helper reads like apksigner does.
  // The file is removed once the helper exits.

public:
  ToolSigner(kj::Array<kj::String> command, kj::StringPtr scratchPath);
  // `command` is the argv prefix for the helper, e.g. {"java", "-jar", "signer.jar"}.
  // `scratchPath` is the reusable single-variant bin file.

  kj::String computeV1Digest(kj::StringPtr apk, const DigestOptions& options) override;
  void embedV1Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                        kj::StringPtr outputApk) override;
  kj::String computeV2V3Digest(kj::StringPtr v1SignedApk, const DigestOptions& options) override;
  void embedV2V3Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                          SchemeFlags flags, kj::StringPtr outputApk) override;

private:
  kj::Array<kj::String> command;
  kj::String scratchPath;

  kj::String computeDigest(kj::StringPtr subcommand, kj::StringPtr apk,
                           const DigestOptions& options);
  void run(kj::StringPtr subcommand, kj::Vector<kj::String>&& args);
  void writeScratch(kj::StringPtr apk, kj::StringPtr payload);
  void writePasswordFile(kj::StringPtr path, kj::StringPtr password);
  kj::String readScratch(kj::StringPtr apk);
};

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_TOOL_SIGNER_H_
