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
#include "test-util.h"
#include "util.h"
#include "workspace.h"
#include <kj/test.h>

namespace bundlesigner {
namespace {

TransferFile parse(kj::StringPtr text) {
  kj::ArrayInputStream input(kj::arrayPtr(reinterpret_cast<const byte*>(text.begin()),
                                          text.size()));
  return parseTransferFile(input);
}

kj::String format(const TransferFile& file) {
  kj::VectorOutputStream output;
  writeTransferFile(output, file);
  auto bytes = output.getArray();
  return kj::heapString(reinterpret_cast<const char*>(bytes.begin()), bytes.size());
}

ErrorKind parseFailure(kj::StringPtr text) {
  return expectFailure([&]() { parse(text); });
}

SchemeFlags v2Only() {
  SchemeFlags flags;
  flags.v2 = true;
  return flags;
}

KJ_TEST("write: v1 only") {
  TransferFile file{SchemeFlags()};
  KJ_ASSERT(file.add({ kj::str("splits_base-master.apk"), kj::str("AAA"), nullptr }));
  KJ_ASSERT(file.add({ kj::str("universal.apk"), kj::str("BBB"), nullptr }));

  KJ_EXPECT(format(file) ==
      "version: 0.1.4\n"
      "v2:false,v3:false\n"
      "splits_base-master.apk\n"
      "AAA\n"
      "universal.apk\n"
      "BBB\n", format(file));
}

KJ_TEST("write: v2 groups carry two digest lines") {
  TransferFile file(v2Only());
  KJ_ASSERT(file.add({ kj::str("universal.apk"), kj::str("V1"), kj::str("V2") }));

  KJ_EXPECT(format(file) ==
      "version: 0.1.4\n"
      "v2:true,v3:false\n"
      "universal.apk\n"
      "V1\n"
      "V2\n", format(file));
}

KJ_TEST("write: bundle hash goes on the flags line") {
  TransferFile file{SchemeFlags()};
  file.setBundleHash(kj::str("00ff"));
  KJ_EXPECT(formatFlagsLine(file.getFlags(), file.getBundleHash()) ==
            "v2:false,v3:false,bundle-sha256:00ff");
}

KJ_TEST("add rejects duplicates and unrepresentable payloads") {
  TransferFile file{SchemeFlags()};
  KJ_EXPECT(file.add({ kj::str("a.apk"), kj::str("1"), nullptr }));
  KJ_EXPECT(!file.add({ kj::str("a.apk"), kj::str("2"), nullptr }));
  KJ_EXPECT(file.size() == 1);
  KJ_EXPECT(KJ_ASSERT_NONNULL(file.find("a.apk")).v1 == "1");

  KJ_EXPECT(expectFailure([&]() {
    file.add({ kj::str("b.apk"), kj::str("looks like x.apk"), nullptr });
  }) == ErrorKind::SIGNER);
  KJ_EXPECT(expectFailure([&]() {
    file.add({ kj::str("b.apk"), kj::str("two\nlines"), nullptr });
  }) == ErrorKind::SIGNER);

  // A V2/V3 payload in a v1-only file is a programming error, not a data error.
  KJ_EXPECT_THROW_MESSAGE("doesn't match scheme flags",
      file.add({ kj::str("c.apk"), kj::str("1"), kj::str("2") }));
}

KJ_TEST("parse: round trip") {
  TransferFile file(v2Only());
  KJ_ASSERT(file.add({ kj::str("arm64-v8a_base.apk"), kj::str("a1"), kj::str("a2") }));
  KJ_ASSERT(file.add({ kj::str("universal.apk"), kj::str("u1"), kj::str("u2") }));

  auto parsed = parse(format(file));
  KJ_EXPECT(parsed.getVersion() == "0.1.4");
  KJ_EXPECT(parsed.getFlags() == file.getFlags());
  KJ_EXPECT(parsed.getBundleHash() == nullptr);
  KJ_ASSERT(parsed.size() == 2);
  KJ_EXPECT(parsed.getVariants()[0].name == "arm64-v8a_base.apk");
  KJ_EXPECT(parsed.getVariants()[1].name == "universal.apk");

  auto& universal = KJ_ASSERT_NONNULL(parsed.find("universal.apk"));
  KJ_EXPECT(universal.v1 == "u1");
  KJ_EXPECT(KJ_ASSERT_NONNULL(universal.v2v3) == "u2");
}

KJ_TEST("parse: v2 and v3 are read independently") {
  auto parsed = parse("version: 0.1.4\nv2:false,v3:true\nuniversal.apk\nx\ny\n");
  KJ_EXPECT(!parsed.getFlags().v2);
  KJ_EXPECT(parsed.getFlags().v3);

  parsed = parse("version: 0.1.4\nv2:true,v3:false\nuniversal.apk\nx\ny\n");
  KJ_EXPECT(parsed.getFlags().v2);
  KJ_EXPECT(!parsed.getFlags().v3);
}

KJ_TEST("parse: extra flag fields") {
  auto parsed = parse("version: 0.1.4\nv2:false,v3:false,bundle-sha256:abcd\na.apk\nx\n");
  auto hash = parsed.getBundleHash();
  KJ_EXPECT(KJ_ASSERT_NONNULL(hash) == "abcd");

  // Unknown fields are skipped with a warning.
  KJ_EXPECT_LOG(WARNING, "Ignoring unrecognized transfer file field");
  parsed = parse("version: 0.1.4\nv3:false,v2:false,future:1\na.apk\nx\n");
  KJ_EXPECT(parsed.size() == 1);
}

KJ_TEST("parse: last group one digest short under v2") {
  auto kind = parseFailure(
      "version: 0.1.4\nv2:true,v3:false\n"
      "splits_base-master.apk\nm1\nm2\n"
      "universal.apk\nu1\n");
  KJ_EXPECT(kind == ErrorKind::FORMAT);
}

KJ_TEST("parse: middle group one digest short under v2") {
  KJ_EXPECT_THROW_MESSAGE("has one digest line but v2/v3 signing needs two", parse(
      "version: 0.1.4\nv2:false,v3:true\n"
      "splits_base-master.apk\nm1\n"
      "universal.apk\nu1\nu2\n"));
}

KJ_TEST("parse: malformed files") {
  auto expectFormat = [](kj::StringPtr text) {
    KJ_EXPECT(parseFailure(text) == ErrorKind::FORMAT, text);
  };

  expectFormat("");
  expectFormat("version: 0.1.4\n");
  expectFormat("v2:false,v3:false\na.apk\nx\n");
  expectFormat("version: 0.1.4\nv2:false\na.apk\nx\n");
  expectFormat("version: 0.1.4\nv2:maybe,v3:false\na.apk\nx\n");
  expectFormat("version: 0.1.4\nv2:false,v2:true,v3:false\n");
  expectFormat("version: 0.1.4\nv2:false,v3:false\nnot a name\n");
  expectFormat("version: 0.1.4\nv2:false,v3:false\na.apk\n");
  expectFormat("version: 0.1.4\nv2:false,v3:false\na.apk\nb.apk\nx\n");
  expectFormat("version: 0.1.4\nv2:false,v3:false\na.apk\nx\n\nb.apk\ny\n");
  expectFormat("version: 0.1.4\nv2:false,v3:false\na.apk\nx\na.apk\ny\n");
}

KJ_TEST("parse: tolerates a missing final newline") {
  auto parsed = parse("version: 0.1.4\nv2:false,v3:false\na.apk\nx");
  KJ_EXPECT(parsed.size() == 1);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parsed.find("a.apk")).v1 == "x");
}

KJ_TEST("parse: CRLF line endings") {
  auto parsed = parse(
      "version: 0.1.4\r\n"
      "v2:true,v3:false\r\n"
      "x86_base.apk\r\n"
      "d1-xx\r\n"
      "d23-xx\r\n"
      "universal.apk\r\n"
      "d1-yy\r\n"
      "d23-yy\r\n");

  KJ_EXPECT(parsed.getFlags() == v2Only());
  KJ_ASSERT(parsed.size() == 2);
  KJ_EXPECT(parsed.getVariants()[0].name == "x86_base.apk");
  auto& universal = KJ_ASSERT_NONNULL(parsed.find("universal.apk"));
  KJ_EXPECT(universal.v1 == "d1-yy");
  KJ_EXPECT(KJ_ASSERT_NONNULL(universal.v2v3) == "d23-yy");

  // A line holding only the carriage return is still an empty line.
  KJ_EXPECT(parseFailure("version: 0.1.4\r\nv2:false,v3:false\r\n\r\n") == ErrorKind::FORMAT);
}

KJ_TEST("merge digest logs") {
  Workspace dir(testTmpDir());
  auto v1Log = dir.file("binv1");
  auto v2v3Log = dir.file("binv2_v3");

  appendDigestGroup(v1Log, "splits_base-master.apk", "m1");
  appendDigestGroup(v2v3Log, "splits_base-master.apk", "m2");
  appendDigestGroup(v1Log, "universal.apk", "u1");
  appendDigestGroup(v2v3Log, "universal.apk", "u2");

  KJ_EXPECT(readAll(v1Log) == "splits_base-master.apk\nm1\nuniversal.apk\nu1\n");

  auto merged = mergeDigestLogs(v2Only(), v1Log, kj::StringPtr(v2v3Log));
  KJ_ASSERT(merged.size() == 2);
  KJ_EXPECT(merged.getVariants()[0].v1 == "m1");
  KJ_EXPECT(KJ_ASSERT_NONNULL(merged.getVariants()[1].v2v3) == "u2");

  auto path = dir.file("app.bin");
  writeTransferFile(path, merged);
  KJ_EXPECT(readAll(path) ==
      "version: 0.1.4\nv2:true,v3:false\n"
      "splits_base-master.apk\nm1\nm2\n"
      "universal.apk\nu1\nu2\n");
  KJ_EXPECT(readTransferFile(path).size() == 2);
}

KJ_TEST("merge digest logs: mismatches") {
  Workspace dir(testTmpDir());
  auto v1Log = dir.file("binv1");
  auto v2v3Log = dir.file("binv2_v3");

  // A log that was never written counts as empty.
  KJ_EXPECT(mergeDigestLogs(SchemeFlags(), v1Log, nullptr).size() == 0);

  appendDigestGroup(v1Log, "a.apk", "1");
  appendDigestGroup(v1Log, "b.apk", "2");
  appendDigestGroup(v2v3Log, "b.apk", "2");
  appendDigestGroup(v2v3Log, "a.apk", "1");
  KJ_EXPECT(expectFailure([&]() {
    mergeDigestLogs(v2Only(), v1Log, kj::StringPtr(v2v3Log));
  }) == ErrorKind::FORMAT);

  appendDigestGroup(v1Log, "a.apk", "3");
  KJ_EXPECT(expectFailure([&]() {
    mergeDigestLogs(SchemeFlags(), v1Log, nullptr);
  }) == ErrorKind::CORRELATION);
}

KJ_TEST("transfer file naming and bundle hash") {
  KJ_EXPECT(transferFileNameFor("/in/app.release.aab") == "app.bin");

  Workspace dir(testTmpDir());
  auto bundle = dir.file("app.aab");
  writeAll(bundle, "abc");
  KJ_EXPECT(computeBundleHash(bundle) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

}  // namespace
}  // namespace bundlesigner
