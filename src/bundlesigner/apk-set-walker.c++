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

#include "apk-set-walker.h"
#include "errors.h"
#include "transfer-file.h"
#include "util.h"
#include <kj/debug.h>
#include <string.h>

namespace bundlesigner {

namespace {

kj::StringPtr truncateAfterMarker(kj::StringPtr entryPath, kj::String& storage) {
  auto marker = findSubstring(entryPath, APK_MARKER);
  KJ_IF_MAYBE(pos, marker) {
    storage = kj::heapString(entryPath.slice(0, *pos + strlen(APK_MARKER)));
    return storage;
  } else {
    return entryPath;
  }
}

void checkEntryPath(kj::StringPtr archivePath, kj::StringPtr entryPath) {
  BUNDLESIGNER_REQUIRE(!entryPath.startsWith("/"), IO,
      "APK Set entry has an absolute path: ", entryPath, " in ", archivePath);
  for (auto segment: split(entryPath, '/')) {
    BUNDLESIGNER_REQUIRE(kj::heapString(segment) != "..", IO,
        "APK Set entry escapes the extraction directory: ", entryPath, " in ", archivePath);
  }
}

kj::String escapeWildcards(kj::StringPtr entryPath) {
  // unzip treats member names as patterns. Wrapping each special character in a bracket
  // expression matches it literally. A backslash has to be doubled instead: unzip reads
  // "[\]" as an escaped ']' inside an unterminated set.
  kj::Vector<char> result(entryPath.size() + 8);
  for (char c: entryPath) {
    if (c == '\\') {
      result.add('\\');
      result.add('\\');
    } else if (c == '*' || c == '?' || c == '[') {
      result.add('[');
      result.add(c);
      result.add(']');
    } else {
      result.add(c);
    }
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

}  // namespace

bool isApkEntry(kj::StringPtr entryPath) {
  return contains(entryPath, APK_MARKER) && !entryPath.endsWith("/");
}

kj::String variantNameForEntry(kj::StringPtr entryPath) {
  kj::String storage;
  auto truncated = truncateAfterMarker(entryPath, storage);
  auto result = kj::heapString(truncated);
  for (char& c: result) {
    if (c == '/') c = '_';
  }
  return result;
}

kj::String outputNameForEntry(kj::StringPtr entryPath) {
  kj::String storage;
  auto truncated = truncateAfterMarker(entryPath, storage);
  auto segments = split(truncated, '/');
  auto leaf = segments.back();

  if (contains(kj::heapString(leaf), "universal") || segments.size() < 2) {
    return kj::heapString(leaf);
  } else {
    return kj::str(segments[segments.size() - 2], "_", leaf);
  }
}

// =======================================================================================

ApkSetWalker::ApkSetWalker(kj::StringPtr archivePath, kj::StringPtr workDir)
    : archivePath(kj::heapString(archivePath)), workDir(kj::heapString(workDir)) {}

kj::Maybe<ExtractedVariant> ApkSetWalker::next() {
  if (entries == nullptr) {
    entries = listEntries();
  }
  auto& list = KJ_ASSERT_NONNULL(entries);

  while (position < list.size()) {
    kj::StringPtr entryPath = list[position++];
    if (!isApkEntry(entryPath)) {
      KJ_LOG(INFO, "skipping non-APK entry", entryPath);
      continue;
    }

    checkEntryPath(archivePath, entryPath);
    auto destination = kj::str(workDir, "/", entryPath);
    extractEntry(entryPath, destination);
    KJ_LOG(INFO, "extracted APK", archivePath, entryPath);

    return ExtractedVariant {
      kj::heapString(entryPath), variantNameForEntry(entryPath), kj::mv(destination)
    };
  }

  return nullptr;
}

kj::Array<kj::String> ApkSetWalker::listEntries() {
  BUNDLESIGNER_REQUIRE(fileExists(archivePath), IO, "APK Set not found: ", archivePath);

  // unzip's diagnostics go straight to our stderr; only the listing is captured.
  auto pipe = Pipe::make();
  Subprocess::Options options({"unzip", "-Z1", archivePath});
  options.stdout = pipe.writeEnd;
  Subprocess unzip(kj::mv(options));
  pipe.writeEnd = nullptr;

  auto listing = readAll(pipe.readEnd);
  int exitCode = unzip.waitForExit();
  BUNDLESIGNER_REQUIRE(exitCode == 0, IO,
      "could not read APK Set ", archivePath, " (unzip exit code ", exitCode, ")");

  kj::Vector<kj::String> result;
  for (auto line: split(listing, '\n')) {
    if (line.size() > 0) {
      result.add(kj::heapString(line));
    }
  }
  return result.releaseAsArray();
}

void ApkSetWalker::extractEntry(kj::StringPtr entryPath, kj::StringPtr destination) {
  recursivelyCreateParent(destination);
  auto output = raiiOpen(destination, O_WRONLY | O_CREAT | O_TRUNC);

  auto pattern = escapeWildcards(entryPath);
  Subprocess::Options options({"unzip", "-p", archivePath, pattern});
  options.stdout = output;
  Subprocess unzip(kj::mv(options));
  int exitCode = unzip.waitForExit();
  BUNDLESIGNER_REQUIRE(exitCode == 0, IO,
      "could not extract ", entryPath, " from ", archivePath,
      " (unzip exit code ", exitCode, ")");
}

}  // namespace bundlesigner
