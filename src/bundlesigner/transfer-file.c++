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

#include "transfer-file.h"
#include "errors.h"
#include "util.h"
#include <kj/debug.h>
#include <sodium/crypto_hash_sha256.h>
#include <string.h>

namespace bundlesigner {

namespace {

constexpr const char* VERSION_PREFIX = "version:";
constexpr const char* BUNDLE_HASH_KEY = "bundle-sha256";

bool isNameLine(kj::StringPtr line) {
  return contains(line, APK_MARKER);
}

void checkPayload(kj::StringPtr variantName, kj::StringPtr payload) {
  // A payload that looked like a name would silently shift every following group.
  BUNDLESIGNER_REQUIRE(payload.size() > 0, SIGNER, "empty digest payload for ", variantName);
  BUNDLESIGNER_REQUIRE(payload.findFirst('\n') == nullptr, SIGNER,
      "digest payload for ", variantName, " spans multiple lines");
  BUNDLESIGNER_REQUIRE(!isNameLine(payload), SIGNER,
      "digest payload for ", variantName, " contains \"", APK_MARKER, "\"");
}

void writeLine(kj::OutputStream& output, kj::StringPtr line) {
  output.write(line.begin(), line.size());
  output.write("\n", 1);
}

enum class ParseState {
  EXPECT_HEADER,
  EXPECT_FLAGS,
  EXPECT_NAME_OR_EOF,
  EXPECT_V1_DIGEST,
  EXPECT_V2V3_DIGEST_OR_NAME
};

TransferFile parseFlagsLine(kj::StringPtr line, kj::StringPtr version) {
  kj::Maybe<bool> v2;
  kj::Maybe<bool> v3;
  kj::Maybe<kj::String> bundleHash;

  for (auto field: split(line, ',')) {
    auto rest = field;
    auto maybeKey = splitFirst(rest, ':');
    kj::String key;
    KJ_IF_MAYBE(k, maybeKey) {
      key = trim(*k);
    } else {
      BUNDLESIGNER_FAIL(FORMAT, "malformed flags field: ", field);
    }
    auto value = trim(rest);

    if (key == "v2" || key == "v3") {
      kj::Maybe<bool>& slot = key == "v2" ? v2 : v3;
      BUNDLESIGNER_REQUIRE(slot == nullptr, FORMAT, "flag repeated in flags line: ", key);
      slot = parseBool(value);
      BUNDLESIGNER_REQUIRE(slot != nullptr, FORMAT, "invalid value for flag ", key, ": ", value);
    } else if (key == BUNDLE_HASH_KEY) {
      BUNDLESIGNER_REQUIRE(value.size() > 0, FORMAT, "empty bundle hash");
      bundleHash = kj::mv(value);
    } else {
      KJ_LOG(WARNING, "Ignoring unrecognized transfer file field", key);
    }
  }

  SchemeFlags flags;
  KJ_IF_MAYBE(b, v2) {
    flags.v2 = *b;
  } else {
    BUNDLESIGNER_FAIL(FORMAT, "flags line lacks v2: ", line);
  }
  KJ_IF_MAYBE(b, v3) {
    flags.v3 = *b;
  } else {
    BUNDLESIGNER_FAIL(FORMAT, "flags line lacks v3: ", line);
  }

  TransferFile result(flags, version);
  KJ_IF_MAYBE(h, bundleHash) {
    result.setBundleHash(kj::mv(*h));
  }
  return result;
}

struct LogEntry {
  kj::String name;
  kj::String payload;
};

kj::Array<LogEntry> readDigestLog(kj::StringPtr path) {
  kj::Vector<LogEntry> entries;

  auto maybeFd = raiiOpenIfExists(path, O_RDONLY);
  KJ_IF_MAYBE(fd, maybeFd) {
    kj::FdInputStream rawInput(fd->get());
    kj::BufferedInputStreamWrapper input(rawInput);
    for (;;) {
      auto name = readLine(input);
      if (name == nullptr) break;
      auto payload = readLine(input);
      BUNDLESIGNER_REQUIRE(payload != nullptr, FORMAT,
          "digest log ends without a payload line", path);
      entries.add(LogEntry {
        kj::mv(KJ_ASSERT_NONNULL(name)), kj::mv(KJ_ASSERT_NONNULL(payload))
      });
    }
  }

  return entries.releaseAsArray();
}

}  // namespace

kj::String KJ_STRINGIFY(const SchemeFlags& flags) {
  return kj::str("v1:", flags.v1, ",v2:", flags.v2, ",v3:", flags.v3);
}

// =======================================================================================

TransferFile::TransferFile(SchemeFlags flags, kj::StringPtr version)
    : version(kj::heapString(version)), flags(flags) {}

kj::Maybe<kj::StringPtr> TransferFile::getBundleHash() const {
  KJ_IF_MAYBE(h, bundleHash) {
    return kj::StringPtr(*h);
  } else {
    return nullptr;
  }
}

void TransferFile::setBundleHash(kj::String hash) {
  BUNDLESIGNER_REQUIRE(hash.size() > 0 && hash.findFirst(',') == nullptr &&
                       hash.findFirst('\n') == nullptr,
                       FORMAT, "unrepresentable bundle hash", hash);
  bundleHash = kj::mv(hash);
}

kj::Maybe<const VariantDigests&> TransferFile::find(kj::StringPtr name) const {
  auto iter = index.find(name);
  if (iter == index.end()) {
    return nullptr;
  } else {
    return variants[iter->second];
  }
}

bool TransferFile::add(VariantDigests&& digests) {
  KJ_REQUIRE(isNameLine(digests.name), "variant name lacks the APK marker", digests.name);
  KJ_REQUIRE(digests.name.findFirst('\n') == nullptr, "variant name spans lines", digests.name);
  KJ_REQUIRE((digests.v2v3 != nullptr) == flags.needsV2V3Digest(),
      "digest group doesn't match scheme flags", digests.name, flags);

  checkPayload(digests.name, digests.v1);
  KJ_IF_MAYBE(p, digests.v2v3) {
    checkPayload(digests.name, *p);
  }

  if (index.count(digests.name) > 0) {
    return false;
  }

  variants.add(kj::mv(digests));
  auto& added = variants.back();
  index.insert(std::make_pair(kj::StringPtr(added.name), variants.size() - 1));
  return true;
}

// =======================================================================================

kj::String formatFlagsLine(SchemeFlags flags, kj::Maybe<kj::StringPtr> bundleHash) {
  KJ_IF_MAYBE(h, bundleHash) {
    return kj::str("v2:", flags.v2, ",v3:", flags.v3, ",", BUNDLE_HASH_KEY, ":", *h);
  } else {
    return kj::str("v2:", flags.v2, ",v3:", flags.v3);
  }
}

void writeTransferFile(kj::OutputStream& output, const TransferFile& file) {
  writeLine(output, kj::str(VERSION_PREFIX, " ", file.getVersion()));
  writeLine(output, formatFlagsLine(file.getFlags(), file.getBundleHash()));
  for (auto& variant: file.getVariants()) {
    writeLine(output, variant.name);
    writeLine(output, variant.v1);
    KJ_IF_MAYBE(p, variant.v2v3) {
      writeLine(output, *p);
    }
  }
}

void writeTransferFile(kj::StringPtr path, const TransferFile& file) {
  auto fd = raiiOpen(path, O_WRONLY | O_CREAT | O_TRUNC);
  kj::FdOutputStream rawOutput(fd.get());
  kj::BufferedOutputStreamWrapper output(rawOutput);
  writeTransferFile(output, file);
  output.flush();
}

void appendDigestGroup(kj::StringPtr logPath, kj::StringPtr variantName,
                       kj::StringPtr payload) {
  KJ_REQUIRE(isNameLine(variantName), "variant name lacks the APK marker", variantName);
  checkPayload(variantName, payload);

  auto fd = raiiOpen(logPath, O_WRONLY | O_CREAT | O_APPEND);
  auto text = kj::str(variantName, '\n', payload, '\n');
  kj::FdOutputStream(fd.get()).write(text.begin(), text.size());
}

TransferFile mergeDigestLogs(SchemeFlags flags, kj::StringPtr v1LogPath,
                             kj::Maybe<kj::StringPtr> v2v3LogPath) {
  KJ_REQUIRE((v2v3LogPath != nullptr) == flags.needsV2V3Digest(),
             "V2/V3 digest log must be given exactly when v2 or v3 is on", flags);

  auto v1Entries = readDigestLog(v1LogPath);
  kj::Array<LogEntry> v2v3Entries;
  KJ_IF_MAYBE(path, v2v3LogPath) {
    v2v3Entries = readDigestLog(*path);
    BUNDLESIGNER_REQUIRE(v2v3Entries.size() == v1Entries.size(), FORMAT,
        "V1 and V2/V3 digest logs have different lengths",
        v1Entries.size(), v2v3Entries.size());
  }

  TransferFile result(flags);
  for (auto i: kj::indices(v1Entries)) {
    VariantDigests digests;
    digests.name = kj::mv(v1Entries[i].name);
    digests.v1 = kj::mv(v1Entries[i].payload);
    if (flags.needsV2V3Digest()) {
      BUNDLESIGNER_REQUIRE(v2v3Entries[i].name == digests.name, FORMAT,
          "digest logs disagree on variant order", digests.name, v2v3Entries[i].name);
      digests.v2v3 = kj::mv(v2v3Entries[i].payload);
    }

    auto name = kj::heapString(digests.name);
    BUNDLESIGNER_REQUIRE(result.add(kj::mv(digests)), CORRELATION,
        "two APK variants normalize to the same name: ", name);
  }

  return result;
}

// =======================================================================================

TransferFile parseTransferFile(kj::BufferedInputStream& input) {
  ParseState state = ParseState::EXPECT_HEADER;
  kj::String version;
  kj::Maybe<TransferFile> result;
  kj::String pendingName;
  kj::String pendingV1;
  uint lineNumber = 0;

  auto commit = [&](kj::Maybe<kj::String> v2v3) {
    auto& file = KJ_ASSERT_NONNULL(result);
    auto name = kj::heapString(pendingName);
    BUNDLESIGNER_REQUIRE(
        file.add(VariantDigests { kj::mv(pendingName), kj::mv(pendingV1), kj::mv(v2v3) }),
        FORMAT, "duplicate variant name in transfer file: ", name);
  };

  for (;;) {
    auto maybeLine = readLine(input);
    kj::String line;
    KJ_IF_MAYBE(l, maybeLine) {
      line = kj::mv(*l);
    } else {
      break;
    }
    ++lineNumber;
    if (line.size() > 0 && line[line.size() - 1] == '\r') {
      // CRLF endings picked up in transit.
      line = kj::heapString(line.slice(0, line.size() - 1));
    }
    BUNDLESIGNER_REQUIRE(line.size() > 0, FORMAT, "line ", lineNumber, " is empty");

    switch (state) {
      case ParseState::EXPECT_HEADER: {
        BUNDLESIGNER_REQUIRE(line.startsWith(VERSION_PREFIX), FORMAT,
            "transfer file doesn't start with a version line: ", line);
        version = trim(line.slice(strlen(VERSION_PREFIX)));
        BUNDLESIGNER_REQUIRE(version.size() > 0, FORMAT, "empty transfer file version");
        if (version != TRANSFER_FORMAT_VERSION) {
          KJ_LOG(WARNING, "transfer file was written by a different version", version);
        }
        state = ParseState::EXPECT_FLAGS;
        break;
      }

      case ParseState::EXPECT_FLAGS:
        result = parseFlagsLine(line, version);
        state = ParseState::EXPECT_NAME_OR_EOF;
        break;

      case ParseState::EXPECT_NAME_OR_EOF:
        BUNDLESIGNER_REQUIRE(isNameLine(line), FORMAT,
            "line ", lineNumber, ": digest line without a variant name");
        pendingName = kj::mv(line);
        state = ParseState::EXPECT_V1_DIGEST;
        break;

      case ParseState::EXPECT_V1_DIGEST:
        BUNDLESIGNER_REQUIRE(!isNameLine(line), FORMAT,
            "line ", lineNumber, ": variant ", pendingName, " has no digest line");
        pendingV1 = kj::mv(line);
        if (KJ_ASSERT_NONNULL(result).getFlags().needsV2V3Digest()) {
          state = ParseState::EXPECT_V2V3_DIGEST_OR_NAME;
        } else {
          commit(nullptr);
          state = ParseState::EXPECT_NAME_OR_EOF;
        }
        break;

      case ParseState::EXPECT_V2V3_DIGEST_OR_NAME:
        BUNDLESIGNER_REQUIRE(!isNameLine(line), FORMAT,
            "line ", lineNumber, ": variant ", pendingName,
            " has one digest line but v2/v3 signing needs two");
        commit(kj::mv(line));
        state = ParseState::EXPECT_NAME_OR_EOF;
        break;
    }
  }

  switch (state) {
    case ParseState::EXPECT_HEADER:
      BUNDLESIGNER_FAIL(FORMAT, "transfer file is empty");
    case ParseState::EXPECT_FLAGS:
      BUNDLESIGNER_FAIL(FORMAT, "transfer file has no flags line");
    case ParseState::EXPECT_V1_DIGEST:
      BUNDLESIGNER_FAIL(FORMAT, "unexpected end of file: variant ", pendingName,
                        " has no digest line");
    case ParseState::EXPECT_V2V3_DIGEST_OR_NAME:
      BUNDLESIGNER_FAIL(FORMAT, "unexpected end of file: variant ", pendingName,
                        " has one digest line but v2/v3 signing needs two");
    case ParseState::EXPECT_NAME_OR_EOF:
      break;
  }

  return kj::mv(KJ_ASSERT_NONNULL(result));
}

TransferFile readTransferFile(kj::StringPtr path) {
  auto fd = raiiOpen(path, O_RDONLY);
  kj::FdInputStream rawInput(fd.get());
  kj::BufferedInputStreamWrapper input(rawInput);
  return parseTransferFile(input);
}

kj::String transferFileNameFor(kj::StringPtr bundlePath) {
  return kj::str(stem(bundlePath), ".bin");
}

kj::String computeBundleHash(kj::StringPtr bundlePath) {
  auto fd = raiiOpen(bundlePath, O_RDONLY);

  crypto_hash_sha256_state state;
  KJ_ASSERT(crypto_hash_sha256_init(&state) == 0);

  byte buffer[8192];
  for (;;) {
    ssize_t n;
    KJ_SYSCALL(n = read(fd, buffer, sizeof(buffer)), bundlePath);
    if (n == 0) break;
    KJ_ASSERT(crypto_hash_sha256_update(&state, buffer, n) == 0);
  }

  byte hash[crypto_hash_sha256_BYTES];
  KJ_ASSERT(crypto_hash_sha256_final(&state, hash) == 0);
  return hexEncode(hash);
}

}  // namespace bundlesigner
