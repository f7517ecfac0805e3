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

#include "tool-signer.h"
#include "errors.h"
#include "util.h"
#include <kj/debug.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

namespace bundlesigner {

static constexpr int HELPER_MIN_SDK_VERSION_ERROR = 3;
static constexpr int HELPER_MALFORMED_APK = 7;

ToolSigner::ToolSigner(kj::Array<kj::String> command, kj::StringPtr scratchPath)
    : command(kj::mv(command)), scratchPath(kj::heapString(scratchPath)) {
  KJ_REQUIRE(this->command.size() > 0, "signing helper command is empty");
}

kj::String ToolSigner::computeV1Digest(kj::StringPtr apk, const DigestOptions& options) {
  return computeDigest("digest-v1", apk, options);
}

void ToolSigner::embedV1Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                                  kj::StringPtr outputApk) {
  writeScratch(inputApk, payload);
  kj::Vector<kj::String> args;
  args.add(kj::str("--in"));
  args.add(kj::heapString(inputApk));
  args.add(kj::str("--bin"));
  args.add(kj::heapString(scratchPath));
  args.add(kj::str("--out"));
  args.add(kj::heapString(outputApk));
  run("sign-v1", kj::mv(args));
}

kj::String ToolSigner::computeV2V3Digest(kj::StringPtr v1SignedApk,
                                         const DigestOptions& options) {
  return computeDigest("digest-v2v3", v1SignedApk, options);
}

void ToolSigner::embedV2V3Signature(kj::StringPtr inputApk, kj::StringPtr payload,
                                    SchemeFlags flags, kj::StringPtr outputApk) {
  writeScratch(inputApk, payload);
  kj::Vector<kj::String> args;
  args.add(kj::str("--in"));
  args.add(kj::heapString(inputApk));
  args.add(kj::str("--bin"));
  args.add(kj::heapString(scratchPath));
  args.add(kj::str("--out"));
  args.add(kj::heapString(outputApk));
  args.add(kj::str("--v2-signing-enabled"));
  args.add(kj::str(flags.v2));
  args.add(kj::str("--v3-signing-enabled"));
  args.add(kj::str(flags.v3));
  run("sign-v2v3", kj::mv(args));
}

kj::String ToolSigner::computeDigest(kj::StringPtr subcommand, kj::StringPtr apk,
                                     const DigestOptions& options) {
  BUNDLESIGNER_REQUIRE(options.signers.size() > 0, PARAMETER,
                       "At least one signer must be specified");

  if (fileExists(scratchPath)) {
    KJ_SYSCALL(unlink(scratchPath.cStr()), scratchPath);
  }

  kj::Vector<kj::String> args;
  args.add(kj::str("--in"));
  args.add(kj::heapString(apk));
  args.add(kj::str("--bin"));
  args.add(kj::heapString(scratchPath));
  KJ_IF_MAYBE(v, options.minSdkVersion) {
    args.add(kj::str("--min-sdk-version"));
    args.add(kj::str(*v));
  }
  args.add(kj::str("--debuggable-apk-permitted"));
  args.add(kj::str(options.debuggableApkPermitted));
  args.add(kj::str("--v2-signing-enabled"));
  args.add(kj::str(options.flags.v2));
  args.add(kj::str("--v3-signing-enabled"));
  args.add(kj::str(options.flags.v3));

  // Literal passwords would be readable by anyone through /proc/<pid>/cmdline.
  kj::Vector<kj::String> passwordFiles;
  KJ_DEFER({
    for (auto& path: passwordFiles) {
      if (unlink(path.cStr()) < 0) {
        KJ_LOG(WARNING, "couldn't remove password file", path, strerror(errno));
      }
    }
  });

  for (auto i: kj::indices(options.signers)) {
    if (i > 0) args.add(kj::str("--next-signer"));
    size_t first = args.size();
    options.signers[i].addArgs(args);
    for (size_t j = first; j + 1 < args.size(); j++) {
      bool isPassword = args[j] == "--ks-pass" || args[j] == "--key-pass";
      if (isPassword && args[j + 1].startsWith("pass:")) {
        auto path = kj::str(scratchPath, ".signer", i + 1, ".", args[j].slice(2));
        writePasswordFile(path, args[j + 1].slice(strlen("pass:")));
        args[j + 1] = kj::str("file:", path);
        passwordFiles.add(kj::mv(path));
      }
    }
  }

  run(subcommand, kj::mv(args));
  return readScratch(apk);
}

void ToolSigner::writePasswordFile(kj::StringPtr path, kj::StringPtr password) {
  if (fileExists(path)) {
    KJ_SYSCALL(unlink(path.cStr()), path);
  }
  auto fd = raiiOpen(path, O_WRONLY | O_CREAT | O_EXCL, 0600);
  auto text = kj::str(password, '\n');
  kj::FdOutputStream(fd.get()).write(text.begin(), text.size());
}

void ToolSigner::run(kj::StringPtr subcommand, kj::Vector<kj::String>&& args) {
  kj::Vector<kj::StringPtr> argv(command.size() + args.size() + 1);
  for (auto& part: command) argv.add(part);
  argv.add(subcommand);
  for (auto& arg: args) argv.add(arg);

  KJ_LOG(INFO, "running signing helper", subcommand, args[1]);
  auto result = runCommand(argv.asPtr());

  switch (result.exitCode) {
    case 0:
      return;
    case HELPER_MIN_SDK_VERSION_ERROR:
      BUNDLESIGNER_FAIL(MIN_SDK_VERSION, args[1], ": ", trim(result.output));
    case HELPER_MALFORMED_APK:
      BUNDLESIGNER_FAIL(MALFORMED_APK, args[1], ": ", trim(result.output));
    default:
      BUNDLESIGNER_FAIL(SIGNER, command[0], " ", subcommand, " failed for ", args[1],
                        " (exit code ", result.exitCode, "): ", trim(result.output));
  }
}

void ToolSigner::writeScratch(kj::StringPtr apk, kj::StringPtr payload) {
  writeAll(scratchPath, kj::str(apk, '\n', payload, '\n'));
}

kj::String ToolSigner::readScratch(kj::StringPtr apk) {
  BUNDLESIGNER_REQUIRE(fileExists(scratchPath), SIGNER,
      "signing helper wrote no bin file for ", apk);

  auto content = readAll(scratchPath);
  auto lines = split(content, '\n');
  BUNDLESIGNER_REQUIRE(lines.size() >= 2 && lines[1].size() > 0, SIGNER,
      "signing helper wrote a malformed bin file for ", apk);
  for (auto i: kj::range<size_t>(2, lines.size())) {
    BUNDLESIGNER_REQUIRE(lines[i].size() == 0, SIGNER,
        "signing helper wrote more than one payload line for ", apk);
  }
  return kj::heapString(lines[1]);
}

}  // namespace bundlesigner
