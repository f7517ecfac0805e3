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

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/io.h>
#include <unistd.h>
#include <sys/wait.h>
#include "bundle-expander.h"
#include "config.h"
#include "digest-recorder.h"
#include "errors.h"
#include "signature-applier.h"
#include "tool-signer.h"
#include "transfer-file.h"
#include "util.h"
#include "workspace.h"

namespace bundlesigner {

class ExitCodeContext final: public kj::ProcessContext {
  // Wraps the top-level context so that option errors reported by kj::MainBuilder end the
  // process with the parameter error code, and so that commands can exit with a specific code.

public:
  explicit ExitCodeContext(kj::ProcessContext& inner): inner(inner) {}

  void setExitCode(int code) { exitCode = code; }

  kj::StringPtr getProgramName() override { return inner.getProgramName(); }
  KJ_NORETURN(void exit() override);
  void warning(kj::StringPtr message) override { inner.warning(message); }
  void error(kj::StringPtr message) override { inner.error(message); }
  KJ_NORETURN(void exitError(kj::StringPtr message) override);
  KJ_NORETURN(void exitInfo(kj::StringPtr message) override);
  void increaseLoggingVerbosity() override { inner.increaseLoggingVerbosity(); }

private:
  kj::ProcessContext& inner;
  int exitCode = 0;
};

void ExitCodeContext::exit() {
  if (exitCode == 0) {
    inner.exit();
  }
  _exit(exitCode);
}

void ExitCodeContext::exitError(kj::StringPtr message) {
  inner.warning(message);
  _exit(EXIT_PARAMETER_ERROR);
}

void ExitCodeContext::exitInfo(kj::StringPtr message) {
  inner.exitInfo(message);
}

// =======================================================================================

static kj::Array<kj::String> copyCommand(kj::ArrayPtr<const kj::String> command) {
  return KJ_MAP(part, command) { return kj::heapString(part); };
}

class BundleSignerMain {
  // Main class for the bundle-signer tool.

public:
  BundleSignerMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    auto mainFunc = kj::MainBuilder(context, "Bundle Signer version " BUNDLESIGNER_VERSION,
          "Signs Android App Bundles in two separate steps so that the machine holding the "
          "signing key never has to expand the bundle.\n"
          "\n"
          "`genbin` rebuilds the bundle's split and universal APK Sets and records the content "
          "digest of every APK in a small text file. Carry that file to the signing side; "
          "the signing helper turns the digests into signatures. `signbundle` then rebuilds "
          "the same APK Sets and embeds the recorded signatures, producing the signed APKs.\n"
          "\n"
          "External programs (bundletool, keytool, the signing helper and apksigner) are "
          "looked up on PATH unless configured otherwise in ~/.bundlesigner.conf.")
        .addSubCommand("genbin", KJ_BIND_METHOD(*this, getGenbinMain),
                       "Record the content digests of a bundle's APKs.")
        .addSubCommand("signbundle", KJ_BIND_METHOD(*this, getSignbundleMain),
                       "Apply signatures recorded by genbin, producing signed APKs.")
        .addSubCommand("verify", KJ_BIND_METHOD(*this, getVerifyMain),
                       "Check the signatures of a signed APK.")
        .addSubCommand("version", KJ_BIND_METHOD(*this, getVersionMain),
                       "Print the version and exit.")
        .build();

    // kj::MainBuilder only knows --help.
    return [mainFunc = kj::mv(mainFunc)](
        kj::StringPtr programName, kj::ArrayPtr<const kj::StringPtr> params) mutable {
      auto rewritten = KJ_MAP(param, params) -> kj::StringPtr {
        return param == "-h" ? kj::StringPtr("--help") : param;
      };
      mainFunc(programName, rewritten);
    };
  }

private:
  ExitCodeContext context;

  kj::Maybe<kj::String> configPath;
  bool verbose = false;

  kj::Maybe<kj::String> bundlePath;
  kj::Maybe<kj::String> binPath;
  kj::Maybe<kj::String> outputPath;

  kj::Vector<SignerConfig> signers;
  SchemeFlags flags;
  kj::Maybe<uint> minSdkVersion;
  kj::Maybe<uint> maxSdkVersion;
  bool debuggableApkPermitted = true;
  bool bindBundle = false;

  kj::Maybe<kj::String> verifyApk;
  bool printCerts = false;
  bool warningsAsErrors = false;

  kj::MainBuilder& addCommonOptions(kj::MainBuilder& builder) {
    builder.addOptionWithArg({"config"}, KJ_BIND_METHOD(*this, setConfigPath), "<path>",
            "Read tool locations from <path> instead of $BUNDLESIGNER_CONFIG or "
            "~/.bundlesigner.conf.")
        .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose),
            "Log each step to stderr.");
    return builder;
  }

  kj::MainBuilder::Validity setConfigPath(kj::StringPtr arg) {
    configPath = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity setVerbose() {
    verbose = true;
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    return true;
  }

  kj::MainBuilder::Validity setBundle(kj::StringPtr arg) {
    bundlePath = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity setBin(kj::StringPtr arg) {
    binPath = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity setOutput(kj::StringPtr arg) {
    outputPath = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity setMinSdkVersion(kj::StringPtr arg) {
    KJ_IF_MAYBE(v, parseUInt(arg, 10)) {
      minSdkVersion = *v;
      return true;
    } else {
      return "Invalid API Level; must be a non-negative integer";
    }
  }

  kj::MainBuilder::Validity setMaxSdkVersion(kj::StringPtr arg) {
    KJ_IF_MAYBE(v, parseUInt(arg, 10)) {
      maxSdkVersion = *v;
      return true;
    } else {
      return "Invalid API Level; must be a non-negative integer";
    }
  }

  static kj::MainBuilder::Validity parseBoolOption(bool& target, kj::StringPtr arg) {
    KJ_IF_MAYBE(b, parseBool(arg)) {
      target = *b;
      return true;
    } else {
      return "expected true or false";
    }
  }

  kj::MainBuilder::Validity setV2(kj::StringPtr arg) { return parseBoolOption(flags.v2, arg); }
  kj::MainBuilder::Validity setV3(kj::StringPtr arg) { return parseBoolOption(flags.v3, arg); }
  kj::MainBuilder::Validity setDebuggable(kj::StringPtr arg) {
    return parseBoolOption(debuggableApkPermitted, arg);
  }

  kj::MainBuilder::Validity setBindBundle() {
    bindBundle = true;
    return true;
  }

  // -----------------------------------------------------------------------------------
  // Signer selection. Options apply to the current signer; --next-signer starts another.

  SignerConfig& currentSigner() {
    if (signers.size() == 0) {
      return startSigner();
    }
    return signers.back();
  }

  SignerConfig& startSigner() {
    auto& signer = signers.add();
    signer.name = kj::str("signer #", signers.size());
    return signer;
  }

  kj::MainBuilder::Validity setSignerField(kj::Maybe<kj::String> SignerConfig::* field,
                                           kj::StringPtr option, kj::StringPtr arg) {
    auto& signer = currentSigner();
    if (signer.*field != nullptr) {
      return kj::str(option, " given twice for ", signer.name);
    }
    signer.*field = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity nextSigner() {
    if (signers.size() == 0 || signers.back().isEmpty()) {
      return "--next-signer must follow the parameters of a signer";
    }
    startSigner();
    return true;
  }

  kj::MainBuilder& addSignerOptions(kj::MainBuilder& builder) {
    struct SignerOption {
      const char* name;
      kj::Maybe<kj::String> SignerConfig::* field;
      const char* argTitle;
      const char* help;
    };
    static const SignerOption OPTIONS[] = {
      { "ks", &SignerConfig::keystore, "<file>", "Keystore holding the signing key." },
      { "ks-key-alias", &SignerConfig::keyAlias, "<alias>", "Alias of the key in the keystore." },
      { "ks-pass", &SignerConfig::keystorePassword, "<source>",
        "Keystore password: env:<name>, file:<path> or pass:<password>. A pass: value "
        "is handed to the signing helper through a private file, but it is still visible in "
        "this tool's own command line; prefer env: or file:." },
      { "key-pass", &SignerConfig::keyPassword, "<source>",
        "Key password, if different from the keystore password. Same forms as --ks-pass." },
      { "pass-encoding", &SignerConfig::passwordEncoding, "<charset>",
        "Additional character encoding to try for passwords." },
      { "v1-signer-name", &SignerConfig::v1SignerName, "<name>",
        "Base name of the META-INF signature files." },
      { "ks-type", &SignerConfig::keystoreType, "<type>", "Keystore type." },
      { "ks-provider-name", &SignerConfig::providerName, "<name>",
        "Name of the security provider for the keystore." },
      { "ks-provider-class", &SignerConfig::providerClass, "<class>",
        "Class of the security provider for the keystore." },
      { "ks-provider-arg", &SignerConfig::providerArg, "<arg>",
        "Constructor argument of the keystore provider class." },
      { "key", &SignerConfig::keyFile, "<file>", "PKCS #8 private key file." },
      { "cert", &SignerConfig::certFile, "<file>", "X.509 certificate chain file." },
    };

    for (auto& option: OPTIONS) {
      auto field = option.field;
      auto flag = option.name;
      builder.addOptionWithArg({option.name},
          [this,field,flag](kj::StringPtr arg) -> kj::MainBuilder::Validity {
            return setSignerField(field, kj::str("--", flag), arg);
          }, option.argTitle, option.help);
    }
    builder.addOption({"next-signer"}, KJ_BIND_METHOD(*this, nextSigner),
        "Start the parameters of another signer.");
    return builder;
  }

  // -----------------------------------------------------------------------------------
  // Running a phase

  int runCatching(kj::Function<void()> func) {
    // Returns the exit code for whatever `func` threw, after reporting it.
    try {
      func();
      return 0;
    } catch (const Failure& failure) {
      context.warning(describeFailure(failure));
      return exitCodeFor(failure.getKind());
    } catch (const kj::Exception& exception) {
      context.warning(describeFailure(exception));
      return EXIT_RUNTIME_ERROR;
    }
  }

  KJ_NORETURN(void exitWith(int code));

  kj::Maybe<kj::StringPtr> getConfigPath() {
    KJ_IF_MAYBE(path, configPath) {
      return kj::StringPtr(*path);
    } else {
      return nullptr;
    }
  }

  kj::MainBuilder::Validity runPhase(kj::Function<void(const Config&, Workspace&)> phase) {
    Config config;
    kj::Own<Workspace> workspace;
    int code = runCatching([&]() {
      config = loadConfig(getConfigPath());
      workspace = kj::heap<Workspace>(config.tmpDir);
    });
    if (code != 0) exitWith(code);

    int status = 0;
    code = runCatching([&]() {
      status = runInterruptible(context, [&]() -> int {
        return runCatching([&]() { phase(config, *workspace); });
      });
    });
    if (code == 0) {
      if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
      } else if (WIFSIGNALED(status)) {
        code = 128 + WTERMSIG(status);
      } else {
        code = EXIT_RUNTIME_ERROR;
      }
    }

    if (!workspace->cleanup() && code == 0) {
      code = EXIT_CLEANUP_FAILED;
    }
    exitWith(code);
  }

  void printLine(kj::StringPtr line) {
    auto text = kj::str(line, '\n');
    kj::FdOutputStream(STDOUT_FILENO).write(text.begin(), text.size());
  }

  // -----------------------------------------------------------------------------------
  // genbin

  kj::MainFunc getGenbinMain() {
    auto builder = kj::MainBuilder(context, "Bundle Signer version " BUNDLESIGNER_VERSION,
          "Expands <bundle> into its split and universal APK Sets and writes the content digests "
          "of every APK to <dir>/<bundle name>.bin. No private key is used, but the signer "
          "options must describe the key that will sign, since they determine the shape of "
          "the signature files.")
        .addOptionWithArg({"bundle"}, KJ_BIND_METHOD(*this, setBundle), "<path>",
            "The App Bundle to sign.")
        .addOptionWithArg({"bin"}, KJ_BIND_METHOD(*this, setBin), "<dir>",
            "Directory to write the transfer file to. Created if missing.")
        .addOptionWithArg({"min-sdk-version"}, KJ_BIND_METHOD(*this, setMinSdkVersion), "<level>",
            "Lowest API Level the APKs must run on, instead of each APK's declared minimum.")
        .addOptionWithArg({"max-sdk-version"}, KJ_BIND_METHOD(*this, setMaxSdkVersion), "<level>",
            "Highest API Level the APKs must run on.")
        .addOptionWithArg({"v2-signing-enabled"}, KJ_BIND_METHOD(*this, setV2), "<true|false>",
            "Whether to sign with APK Signature Scheme v2. Default false.")
        .addOptionWithArg({"v3-signing-enabled"}, KJ_BIND_METHOD(*this, setV3), "<true|false>",
            "Whether to sign with APK Signature Scheme v3. Default false.")
        .addOptionWithArg({"debuggable-apk-permitted"}, KJ_BIND_METHOD(*this, setDebuggable),
            "<true|false>", "Whether debuggable APKs may be signed. Default true.")
        .addOption({"bind-bundle"}, KJ_BIND_METHOD(*this, setBindBundle),
            "Record the bundle's SHA-256 so that signbundle refuses any other bundle.");
    addSignerOptions(builder);
    return addCommonOptions(builder)
        .callAfterParsing(KJ_BIND_METHOD(*this, doGenbin))
        .build();
  }

  kj::MainBuilder::Validity doGenbin() {
    kj::StringPtr bundle;
    kj::StringPtr binDir;
    KJ_IF_MAYBE(b, bundlePath) {
      bundle = *b;
    } else {
      return "Missing input Bundle file path";
    }
    KJ_IF_MAYBE(b, binPath) {
      binDir = *b;
    } else {
      return "Missing output Bin file path";
    }
    if (!fileExists(bundle)) {
      return "Input bundle file does not exist";
    }
    if (signers.size() == 0) {
      return "At least one signer must be specified";
    }
    for (auto& signer: signers) {
      if (signer.isEmpty()) {
        return kj::str("Signer parameters missing for ", signer.name);
      }
    }
    KJ_IF_MAYBE(min, minSdkVersion) {
      KJ_IF_MAYBE(max, maxSdkVersion) {
        if (*min > *max) {
          return kj::str("Min API Level (", *min, ") > max API Level (", *max, ")");
        }
      }
    }

    return runPhase([&](const Config& config, Workspace& workspace) {
      BundletoolExpander expander(workspace, copyCommand(config.bundletool),
                                  copyCommand(config.keytool));
      ToolSigner signer(copyCommand(config.signerTool), workspace.getScratchPath());
      DigestRecorder recorder(workspace, expander, signer);
      recorder.setBindBundle(bindBundle);

      auto transfer = recorder.generate(bundle, signers.asPtr(), flags, minSdkVersion,
                                        debuggableApkPermitted);

      if (!isDirectory(binDir)) {
        recursivelyCreateDirectory(binDir);
      }
      auto output = kj::str(binDir, "/", transferFileNameFor(bundle));
      writeTransferFile(output, transfer);
      KJ_LOG(INFO, "wrote transfer file", output, transfer.size());

      if (verbose) {
        printLine("Digest content generated");
      }
    });
  }

  // -----------------------------------------------------------------------------------
  // signbundle

  kj::MainFunc getSignbundleMain() {
    auto builder = kj::MainBuilder(context, "Bundle Signer version " BUNDLESIGNER_VERSION,
          "Rebuilds the APK Sets of <bundle>, which must be the bundle given to genbin, embeds "
          "the signatures carried by the transfer file and writes the signed APKs to <dir>. "
          "The signature schemes are the ones recorded by genbin.")
        .addOptionWithArg({"bundle"}, KJ_BIND_METHOD(*this, setBundle), "<path>",
            "The App Bundle that genbin was run on.")
        .addOptionWithArg({"bin"}, KJ_BIND_METHOD(*this, setBin), "<path>",
            "The transfer file, with signatures filled in by the signing helper.")
        .addOptionWithArg({"out"}, KJ_BIND_METHOD(*this, setOutput), "<dir>",
            "Directory for the signed APKs. Created if missing.");
    return addCommonOptions(builder)
        .callAfterParsing(KJ_BIND_METHOD(*this, doSignbundle))
        .build();
  }

  kj::MainBuilder::Validity doSignbundle() {
    kj::StringPtr bundle;
    kj::StringPtr bin;
    kj::StringPtr output;
    KJ_IF_MAYBE(b, bundlePath) {
      bundle = *b;
    } else {
      return "Missing bundle file";
    }
    KJ_IF_MAYBE(b, binPath) {
      bin = *b;
    } else {
      return "Missing bin file";
    }
    KJ_IF_MAYBE(o, outputPath) {
      output = *o;
    } else {
      return "Missing output path";
    }
    if (!fileExists(bin)) {
      return "Passed Bin file does not exist";
    }
    if (!fileExists(bundle)) {
      return "Bundle file does not exist";
    }

    return runPhase([&](const Config& config, Workspace& workspace) {
      BundletoolExpander expander(workspace, copyCommand(config.bundletool),
                                  copyCommand(config.keytool));
      ToolSigner signer(copyCommand(config.signerTool), workspace.getScratchPath());
      SignatureApplier applier(workspace, expander, signer);

      auto results = applier.apply(bundle, bin, output);
      if (verbose) {
        for (auto& path: results) {
          printLine(kj::str("Signed ", path));
        }
      }
    });
  }

  // -----------------------------------------------------------------------------------
  // verify

  kj::MainFunc getVerifyMain() {
    auto builder = kj::MainBuilder(context, "Bundle Signer version " BUNDLESIGNER_VERSION,
          "Runs `apksigner verify` on <apk>. Exits with status 1 if the APK does not verify.")
        .addOptionWithArg({"min-sdk-version"}, KJ_BIND_METHOD(*this, setMinSdkVersion), "<level>",
            "Lowest API Level on which the APK must verify.")
        .addOptionWithArg({"max-sdk-version"}, KJ_BIND_METHOD(*this, setMaxSdkVersion), "<level>",
            "Highest API Level on which the APK must verify.")
        .addOption({"print-certs"}, KJ_BIND_METHOD(*this, setPrintCerts),
            "Print the signer certificates.")
        .addOptionWithArg({'W'}, KJ_BIND_METHOD(*this, setWarningOption), "err",
            "Treat warnings as errors.")
        .addOptionWithArg({"in"}, KJ_BIND_METHOD(*this, setVerifyApk), "<apk>",
            "The APK to verify.")
        .expectOptionalArg("<apk>", KJ_BIND_METHOD(*this, setVerifyApk));
    return addCommonOptions(builder)
        .callAfterParsing(KJ_BIND_METHOD(*this, doVerify))
        .build();
  }

  kj::MainBuilder::Validity setPrintCerts() {
    printCerts = true;
    return true;
  }

  kj::MainBuilder::Validity setWarningOption(kj::StringPtr arg) {
    if (arg != "err") {
      return "unknown warning option; only -Werr is supported";
    }
    warningsAsErrors = true;
    return true;
  }

  kj::MainBuilder::Validity setVerifyApk(kj::StringPtr arg) {
    if (verifyApk != nullptr) {
      return "Unexpected parameter(s) after input APK";
    }
    verifyApk = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity doVerify() {
    kj::StringPtr apk;
    KJ_IF_MAYBE(a, verifyApk) {
      apk = *a;
    } else {
      return "Missing input APK";
    }
    if (!fileExists(apk)) {
      return kj::str("Input APK does not exist: ", apk);
    }
    KJ_IF_MAYBE(min, minSdkVersion) {
      KJ_IF_MAYBE(max, maxSdkVersion) {
        if (*min > *max) {
          return kj::str("Min API Level (", *min, ") > max API Level (", *max, ")");
        }
      }
    }

    int exitCode = 0;
    int code = runCatching([&]() {
      auto config = loadConfig(getConfigPath());

      kj::Vector<kj::String> args;
      args.add(kj::str("verify"));
      KJ_IF_MAYBE(min, minSdkVersion) {
        args.add(kj::str("--min-sdk-version"));
        args.add(kj::str(*min));
      }
      KJ_IF_MAYBE(max, maxSdkVersion) {
        args.add(kj::str("--max-sdk-version"));
        args.add(kj::str(*max));
      }
      if (printCerts) args.add(kj::str("--print-certs"));
      if (verbose) args.add(kj::str("-v"));
      if (warningsAsErrors) args.add(kj::str("-Werr"));
      args.add(kj::heapString(apk));

      kj::Vector<kj::StringPtr> argv(config.apksigner.size() + args.size());
      for (auto& part: config.apksigner) argv.add(part);
      for (auto& arg: args) argv.add(arg);

      Subprocess verifier(Subprocess::Options(argv.asPtr()));
      exitCode = verifier.waitForExit();
    });
    if (code != 0) exitWith(code);

    exitWith(exitCode == 0 ? 0 : EXIT_VERIFICATION_FAILED);
  }

  // -----------------------------------------------------------------------------------
  // version

  kj::MainFunc getVersionMain() {
    return kj::MainBuilder(context, "Bundle Signer version " BUNDLESIGNER_VERSION,
          "Prints the version of this tool.")
        .callAfterParsing(KJ_BIND_METHOD(*this, doVersion))
        .build();
  }

  kj::MainBuilder::Validity doVersion() {
    context.exitInfo("Bundle Signer version " BUNDLESIGNER_VERSION);
  }
};

void BundleSignerMain::exitWith(int code) {
  context.setExitCode(code);
  context.exit();
}

}  // namespace bundlesigner

KJ_MAIN(bundlesigner::BundleSignerMain)
