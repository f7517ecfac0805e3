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
#include "test-util.h"
#include "util.h"
#include "workspace.h"
#include <kj/test.h>

namespace bundlesigner {
namespace {

// Records its arguments, then acts according to its subcommand. The digest is derived from the
// subcommand and the input's leaf name without its extension.
const char FAKE_HELPER[] =
    "echo \"$@\" >> \"$(dirname \"$0\")/calls.log\"\n"
    "cmd=$1; shift\n"
    "while [ $# -gt 0 ]; do\n"
    "  case \"$1\" in\n"
    "    --in) in=$2; shift 2 ;;\n"
    "    --bin) bin=$2; shift 2 ;;\n"
    "    --out) out=$2; shift 2 ;;\n"
    "    *) shift ;;\n"
    "  esac\n"
    "done\n"
    "leaf=$(basename \"$in\" .apk)\n"
    "case \"$cmd\" in\n"
    "  digest-*) printf '%s\\n%s\\n' \"$in\" \"$cmd:$leaf\" > \"$bin\" ;;\n"
    "  sign-*) { cat \"$in\"; echo; sed -n 2p \"$bin\"; } > \"$out\" ;;\n"
    "esac\n";

struct HelperFixture {
  Workspace dir;
  kj::String helper;
  SignerConfig signers[2];

  HelperFixture(kj::StringPtr script = FAKE_HELPER)
      : dir(testTmpDir()), helper(dir.file("helper")) {
    writeScript(helper, script);
    writeAll(dir.file("base.apk"), "APK");

    signers[0].name = kj::str("signer #1");
    signers[0].keystore = kj::str("/keys/release.jks");
    signers[0].keyAlias = kj::str("release");
    signers[1].name = kj::str("signer #2");
    signers[1].keyFile = kj::str("/keys/rotated.pk8");
    signers[1].certFile = kj::str("/keys/rotated.x509.pem");
  }

  ToolSigner makeSigner() {
    auto command = kj::heapArray<kj::String>(1);
    command[0] = kj::heapString(helper);
    return ToolSigner(kj::mv(command), dir.getScratchPath());
  }

  DigestOptions options(size_t signerCount = 1) {
    DigestOptions result;
    result.flags.v2 = true;
    result.minSdkVersion = 21u;
    result.signers = kj::arrayPtr(signers, signerCount);
    return result;
  }

  kj::String calls() { return readAll(dir.file("calls.log")); }
};

KJ_TEST("ToolSigner digests") {
  HelperFixture fixture;
  auto signer = fixture.makeSigner();

  auto digest = signer.computeV1Digest(fixture.dir.file("base.apk"), fixture.options(2));
  KJ_EXPECT(digest == "digest-v1:base", digest);

  auto calls = fixture.calls();
  KJ_EXPECT(calls.startsWith(kj::str("digest-v1 --in ", fixture.dir.file("base.apk"),
                                     " --bin ", fixture.dir.getScratchPath())), calls);
  KJ_EXPECT(contains(calls, "--min-sdk-version 21 --debuggable-apk-permitted true "
                            "--v2-signing-enabled true --v3-signing-enabled false"), calls);
  KJ_EXPECT(contains(calls, "--ks /keys/release.jks --ks-key-alias release "
                            "--v1-signer-name release --next-signer "
                            "--key /keys/rotated.pk8 --cert /keys/rotated.x509.pem "
                            "--v1-signer-name rotated"), calls);

  digest = signer.computeV2V3Digest(fixture.dir.file("base.apk"), fixture.options());
  KJ_EXPECT(digest == "digest-v2v3:base", digest);
}

KJ_TEST("ToolSigner embeds signatures") {
  HelperFixture fixture;
  auto signer = fixture.makeSigner();

  auto v1Signed = fixture.dir.file("v1.apk");
  signer.embedV1Signature(fixture.dir.file("base.apk"), "SIG1", v1Signed);
  KJ_EXPECT(readAll(v1Signed) == "APK\nSIG1\n", readAll(v1Signed));
  KJ_EXPECT(readAll(fixture.dir.getScratchPath()) ==
            kj::str(fixture.dir.file("base.apk"), "\nSIG1\n"));

  SchemeFlags flags;
  flags.v3 = true;
  auto output = fixture.dir.file("final.apk");
  signer.embedV2V3Signature(v1Signed, "SIG23", flags, output);
  KJ_EXPECT(readAll(output) == "APK\nSIG1\n\nSIG23\n", readAll(output));
  KJ_EXPECT(contains(fixture.calls(),
      "--v2-signing-enabled false --v3-signing-enabled true"), fixture.calls());
}

// Records what it finds behind a file: password spec.
const char PASSWORD_HELPER[] =
    "dir=$(dirname \"$0\")\n"
    "echo \"$@\" >> \"$dir/calls.log\"\n"
    "cmd=$1; shift\n"
    "while [ $# -gt 0 ]; do\n"
    "  case \"$1\" in\n"
    "    --in) in=$2; shift 2 ;;\n"
    "    --bin) bin=$2; shift 2 ;;\n"
    "    --ks-pass) pass=$2; shift 2 ;;\n"
    "    *) shift ;;\n"
    "  esac\n"
    "done\n"
    "f=${pass#file:}\n"
    "echo \"$f\" > \"$dir/pass-path\"\n"
    "cat \"$f\" > \"$dir/pass-content\"\n"
    "stat -c %a \"$f\" > \"$dir/pass-mode\"\n"
    "printf '%s\\n%s\\n' \"$in\" digest > \"$bin\"\n";

KJ_TEST("ToolSigner keeps literal passwords off the command line") {
  HelperFixture fixture(PASSWORD_HELPER);
  fixture.signers[0].keystorePassword = kj::str("pass:s3cret words");
  auto signer = fixture.makeSigner();

  KJ_EXPECT(signer.computeV1Digest(fixture.dir.file("base.apk"), fixture.options()) == "digest");

  auto calls = fixture.calls();
  KJ_EXPECT(!contains(calls, "s3cret"), calls);
  KJ_EXPECT(contains(calls, "--ks-pass file:"), calls);

  KJ_EXPECT(readAll(fixture.dir.file("pass-content")) == "s3cret words\n");
  KJ_EXPECT(readAll(fixture.dir.file("pass-mode")) == "600\n");

  // Gone once the helper has exited.
  auto passwordFile = trim(readAll(fixture.dir.file("pass-path")));
  KJ_EXPECT(passwordFile.startsWith(fixture.dir.getPath()), passwordFile);
  KJ_EXPECT(!fileExists(passwordFile), passwordFile);

  // Other password sources are passed through untouched.
  fixture.signers[0].keystorePassword = kj::str("env:KS_PASS");
  signer.computeV1Digest(fixture.dir.file("base.apk"), fixture.options());
  KJ_EXPECT(contains(fixture.calls(), "--ks-pass env:KS_PASS"), fixture.calls());
}

KJ_TEST("ToolSigner maps helper exit codes") {
  {
    HelperFixture fixture("echo 'no minSdkVersion in manifest' >&2; exit 3\n");
    auto signer = fixture.makeSigner();
    KJ_EXPECT(expectFailure([&]() {
      signer.computeV1Digest(fixture.dir.file("base.apk"), fixture.options());
    }) == ErrorKind::MIN_SDK_VERSION);
  }

  {
    HelperFixture fixture("exit 7\n");
    auto signer = fixture.makeSigner();
    KJ_EXPECT(expectFailure([&]() {
      signer.embedV1Signature(fixture.dir.file("base.apk"), "SIG", fixture.dir.file("o.apk"));
    }) == ErrorKind::MALFORMED_APK);
  }

  {
    HelperFixture fixture("echo 'keystore password was incorrect' >&2; exit 1\n");
    auto signer = fixture.makeSigner();
    try {
      signer.computeV1Digest(fixture.dir.file("base.apk"), fixture.options());
      KJ_FAIL_EXPECT("helper failure not reported");
    } catch (const Failure& failure) {
      KJ_EXPECT(failure.getKind() == ErrorKind::SIGNER);
      KJ_EXPECT(contains(failure.getDescription(), "keystore password was incorrect"),
                failure.getDescription());
    }
  }
}

KJ_TEST("ToolSigner rejects bad bin files") {
  {
    HelperFixture fixture("exit 0\n");
    auto signer = fixture.makeSigner();
    KJ_EXPECT(expectFailure([&]() {
      signer.computeV1Digest(fixture.dir.file("base.apk"), fixture.options());
    }) == ErrorKind::SIGNER);
  }

  {
    HelperFixture fixture(
        "while [ \"$1\" != --bin ]; do shift; done\n"
        "printf 'x.apk\\npayload\\nmore\\n' > \"$2\"\n");
    auto signer = fixture.makeSigner();
    KJ_EXPECT(expectFailure([&]() {
      signer.computeV1Digest(fixture.dir.file("base.apk"), fixture.options());
    }) == ErrorKind::SIGNER);
  }
}

KJ_TEST("ToolSigner needs a signer") {
  HelperFixture fixture;
  auto signer = fixture.makeSigner();
  KJ_EXPECT(expectFailure([&]() {
    signer.computeV1Digest(fixture.dir.file("base.apk"), fixture.options(0));
  }) == ErrorKind::PARAMETER);
}

}  // namespace
}  // namespace bundlesigner
