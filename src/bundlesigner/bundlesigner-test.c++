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

// Runs the bundle-signer executable end to end, with shell scripts standing in for bundletool,
// keytool and the signing helper.

#include "test-util.h"
#include "transfer-file.h"
#include "util.h"
#include "workspace.h"
#include <kj/test.h>
#include <signal.h>

namespace bundlesigner {
namespace {

// Zips one APK (picked by --mode) and a table of contents into --output.
const char FAKE_BUNDLETOOL[] =
    "mode=split\n"
    "while [ $# -gt 0 ]; do\n"
    "  case \"$1\" in\n"
    "    --output) out=$2; shift 2 ;;\n"
    "    --mode=universal) mode=universal; shift ;;\n"
    "    *) shift ;;\n"
    "  esac\n"
    "done\n"
    "if [ $mode = universal ]; then entry=universal.apk; else entry=splits/base-master.apk; fi\n"
    "stage=\"$out.stage\"\n"
    "mkdir -p \"$stage/splits\" && cd \"$stage\" || exit 1\n"
    "echo toc > toc.pb\n"
    "echo \"contents of $entry\" > \"$entry\"\n"
    "zip -q \"$out\" toc.pb \"$entry\"\n"
    "status=$?\n"
    "cd / && rm -rf \"$stage\"\n"
    "exit $status\n";

const char INVALID_BUNDLETOOL[] =
    "echo 'Exception in thread \"main\" com.android.tools.build.bundletool.model.exceptions."
    "InvalidBundleException: Module base is missing a manifest.' >&2\n"
    "exit 1\n";

// Sends SIGTERM to bundle-signer itself, which is the parent of the phase process running us.
const char TERMINATING_BUNDLETOOL[] =
    "kill -TERM \"$(cut -d' ' -f4 /proc/$PPID/stat)\"\n"
    "sleep 5\n";

const char FAKE_KEYTOOL[] =
    "while [ $# -gt 0 ]; do\n"
    "  if [ \"$1\" = -keystore ]; then ks=$2; fi\n"
    "  shift\n"
    "done\n"
    "echo keystore > \"$ks\"\n";

const char FAKE_HELPER[] =
    "cmd=$1; shift\n"
    "while [ $# -gt 0 ]; do\n"
    "  case \"$1\" in\n"
    "    --in) in=$2; shift 2 ;;\n"
    "    --bin) bin=$2; shift 2 ;;\n"
    "    --out) out=$2; shift 2 ;;\n"
    "    *) shift ;;\n"
    "  esac\n"
    "done\n"
    "case \"$cmd\" in\n"
    "  digest-*) printf '%s\\n%s\\n' \"$in\" \"$cmd:$(basename \"$in\" .apk)\" > \"$bin\" ;;\n"
    "  sign-*) { cat \"$in\"; echo; sed -n 2p \"$bin\"; } > \"$out\" ;;\n"
    "esac\n";

struct CliFixture {
  Workspace dir;
  kj::String tmpDir;
  kj::String configPath;
  kj::String bundle;
  kj::String binDir;

  CliFixture(kj::StringPtr bundletoolScript = FAKE_BUNDLETOOL)
      : dir(testTmpDir()), tmpDir(dir.freshDirectory("tmp")), configPath(dir.file("config")),
        bundle(dir.file("app.aab")), binDir(dir.file("bin")) {
    writeScript(dir.file("bundletool"), bundletoolScript);
    writeScript(dir.file("keytool"), FAKE_KEYTOOL);
    writeScript(dir.file("helper"), FAKE_HELPER);
    writeAll(configPath, kj::str(
        "BUNDLETOOL=", dir.file("bundletool"), "\n"
        "KEYTOOL=", dir.file("keytool"), "\n"
        "SIGNER_TOOL=", dir.file("helper"), "\n"
        "TMPDIR=", tmpDir, "\n"));
    writeAll(bundle, "bundle bytes");
  }

  CommandResult run(kj::StringPtr subcommand, std::initializer_list<kj::StringPtr> args) {
    kj::Vector<kj::StringPtr> argv;
    argv.addAll(std::initializer_list<kj::StringPtr>({
        BUNDLE_SIGNER_PATH, subcommand, "--config", configPath}));
    argv.addAll(args);
    return runCommand(argv.asPtr());
  }

  CommandResult genbin(std::initializer_list<kj::StringPtr> extraArgs = {}) {
    kj::Vector<kj::StringPtr> argv;
    argv.addAll(std::initializer_list<kj::StringPtr>({
        BUNDLE_SIGNER_PATH, "genbin", "--config", configPath,
        "--bundle", bundle, "--bin", binDir, "--ks", "release.jks"}));
    argv.addAll(extraArgs);
    return runCommand(argv.asPtr());
  }

  bool workspacesLeft() { return listDirectory(tmpDir).size() > 0; }
};

KJ_TEST("bundle-signer genbin writes a transfer file for V1-only signing") {
  CliFixture fixture;
  auto result = fixture.genbin({"--v2-signing-enabled", "false",
                                "--v3-signing-enabled", "false"});
  KJ_EXPECT(result.exitCode == 0, result.output);

  auto transfer = readTransferFile(kj::str(fixture.binDir, "/app.bin"));
  KJ_EXPECT(transfer.getFlags() == SchemeFlags());
  auto variants = transfer.getVariants();
  KJ_ASSERT(variants.size() == 2);
  KJ_EXPECT(variants[0].name == "splits_base-master.apk");
  KJ_EXPECT(variants[0].v1.startsWith("digest-v1:"), variants[0].v1);
  KJ_EXPECT(variants[0].v2v3 == nullptr);
  KJ_EXPECT(variants[1].name == "universal.apk");
  KJ_EXPECT(variants[1].v2v3 == nullptr);

  KJ_EXPECT(!fixture.workspacesLeft());
}

KJ_TEST("bundle-signer signbundle applies what genbin recorded") {
  CliFixture fixture;
  auto first = fixture.genbin();
  KJ_ASSERT(first.exitCode == 0, first.output);

  auto out = fixture.dir.file("signed");
  auto result = fixture.run("signbundle", {"--bundle", fixture.bundle,
                                           "--bin", kj::str(fixture.binDir, "/app.bin"),
                                           "--out", out});
  KJ_EXPECT(result.exitCode == 0, result.output);

  auto universal = readAll(kj::str(out, "/universal.apk"));
  KJ_EXPECT(universal.startsWith("contents of universal.apk\n\ndigest-v1:"), universal);
  KJ_EXPECT(fileExists(kj::str(out, "/splits_base-master.apk")));
  KJ_EXPECT(fileExists(kj::str(out, "/app.aab.apks")));
  KJ_EXPECT(!fixture.workspacesLeft());
}

KJ_TEST("bundle-signer exits 2 for bad parameters") {
  CliFixture fixture;

  {
    auto result = fixture.genbin({"--min-sdk-version", "30", "--max-sdk-version", "21"});
    KJ_EXPECT(result.exitCode == EXIT_PARAMETER_ERROR, result.exitCode, result.output);
    KJ_EXPECT(contains(result.output, "Min API Level (30) > max API Level (21)"), result.output);
  }

  {
    auto result = fixture.genbin({"--no-such-option"});
    KJ_EXPECT(result.exitCode == EXIT_PARAMETER_ERROR, result.exitCode, result.output);
  }

  {
    auto result = fixture.run("signbundle", {"--bundle", fixture.bundle,
                                             "--bin", fixture.dir.file("missing.bin"),
                                             "--out", fixture.dir.file("signed")});
    KJ_EXPECT(result.exitCode == EXIT_PARAMETER_ERROR, result.exitCode, result.output);
  }

  KJ_EXPECT(!fileExists(fixture.binDir));
  KJ_EXPECT(!fixture.workspacesLeft());
}

KJ_TEST("bundle-signer exits 5 when bundletool rejects the bundle") {
  CliFixture fixture(INVALID_BUNDLETOOL);
  auto result = fixture.genbin();
  KJ_EXPECT(result.exitCode == EXIT_INVALID_BUNDLE, result.exitCode, result.output);
  KJ_EXPECT(!fileExists(fixture.binDir));
  KJ_EXPECT(!fixture.workspacesLeft());
}

KJ_TEST("bundle-signer removes its workspace when the output can't be written") {
  CliFixture fixture;
  // A directory can't be created under a regular file.
  auto blocker = fixture.dir.file("blocker");
  writeAll(blocker, "not a directory");

  auto result = fixture.genbin({"--bin", kj::str(blocker, "/bin")});
  KJ_EXPECT(result.exitCode == EXIT_RUNTIME_ERROR, result.exitCode, result.output);
  KJ_EXPECT(!fixture.workspacesLeft());
}

KJ_TEST("bundle-signer reports a terminating signal and still cleans up") {
  CliFixture fixture(TERMINATING_BUNDLETOOL);
  auto result = fixture.genbin();
  KJ_EXPECT(result.exitCode == 128 + SIGTERM, result.exitCode, result.output);
  KJ_EXPECT(!fixture.workspacesLeft());
}

}  // namespace
}  // namespace bundlesigner
