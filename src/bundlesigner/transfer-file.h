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

#ifndef BUNDLESIGNER_TRANSFER_FILE_H_
#define BUNDLESIGNER_TRANSFER_FILE_H_
// The transfer file carries content digests from `genbin` to `signbundle`. It is plain text:
//
//     version: 0.1.4
//     v2:true,v3:false
//     splits_base-master.apk
//     <V1 payload>
//     <V2/V3 payload>
//     universal.apk
//     ...
//
// A line is a variant name if and only if it contains ".apk", so payloads must never contain
// that marker. Groups carry one payload line when neither v2 nor v3 is on, two otherwise.
//
// The flags line may carry extra `key:value` fields after v2 and v3. The only one we write is
// `bundle-sha256:<hex>`, binding the file to the bundle it was generated from.

#include <kj/string.h>
#include <kj/vector.h>
#include <kj/io.h>
#include <map>

namespace bundlesigner {

constexpr const char* TRANSFER_FORMAT_VERSION = "0.1.4";
constexpr const char* APK_MARKER = ".apk";

struct SchemeFlags {
  bool v1 = true;
  // V1 (JAR) signing is always on.

  bool v2 = false;
  bool v3 = false;

  bool needsV2V3Digest() const { return v2 || v3; }

  bool operator==(const SchemeFlags& other) const {
    return v1 == other.v1 && v2 == other.v2 && v3 == other.v3;
  }
  bool operator!=(const SchemeFlags& other) const { return !(*this == other); }
};

kj::String KJ_STRINGIFY(const SchemeFlags& flags);

struct VariantDigests {
  kj::String name;
  kj::String v1;
  kj::Maybe<kj::String> v2v3;
};

class TransferFile {
  // Parsed or freshly recorded digests, in the order they were written, with a lookup index by
  // variant name. Variant names are unique within a file.

public:
  explicit TransferFile(SchemeFlags flags,
                        kj::StringPtr version = TRANSFER_FORMAT_VERSION);

  KJ_DISALLOW_COPY(TransferFile);
  TransferFile(TransferFile&&) = default;
  TransferFile& operator=(TransferFile&&) = default;

  kj::StringPtr getVersion() const { return version; }
  SchemeFlags getFlags() const { return flags; }

  kj::Maybe<kj::StringPtr> getBundleHash() const;
  void setBundleHash(kj::String hash);

  kj::ArrayPtr<const VariantDigests> getVariants() const { return variants.asPtr(); }
  size_t size() const { return variants.size(); }

  kj::Maybe<const VariantDigests&> find(kj::StringPtr name) const;

  bool add(VariantDigests&& digests);
  // Returns false, leaving the file untouched, if a variant of the same name is already present.
  // Throws if the group doesn't match the scheme flags or a line can't be represented.

private:
  kj::String version;
  SchemeFlags flags;
  kj::Maybe<kj::String> bundleHash;
  kj::Vector<VariantDigests> variants;
  std::map<kj::StringPtr, size_t> index;
  // Keys point into `variants[i].name`, whose heap buffers don't move when the vector grows.
};

// -----------------------------------------------------------------------------
// Writing

kj::String formatFlagsLine(SchemeFlags flags, kj::Maybe<kj::StringPtr> bundleHash = nullptr);

void writeTransferFile(kj::OutputStream& output, const TransferFile& file);
void writeTransferFile(kj::StringPtr path, const TransferFile& file);

void appendDigestGroup(kj::StringPtr logPath, kj::StringPtr variantName,
                       kj::StringPtr payload);
// Append one name line and one payload line to a partial digest log. Each signing pass keeps one
// log per scheme kind; mergeDigestLogs() stitches them into the canonical file.

TransferFile mergeDigestLogs(SchemeFlags flags, kj::StringPtr v1LogPath,
                             kj::Maybe<kj::StringPtr> v2v3LogPath);
// Combine the V1 log and (when v2 or v3 is on) the V2/V3 log. Both must list the same variants in
// the same order. A log that was never created counts as empty.

// -----------------------------------------------------------------------------
// Reading

TransferFile parseTransferFile(kj::BufferedInputStream& input);
TransferFile readTransferFile(kj::StringPtr path);
// Throws Failure(FORMAT) if the content is malformed.

// -----------------------------------------------------------------------------

kj::String transferFileNameFor(kj::StringPtr bundlePath);
// "<dir>/app.release.aab" -> "app.bin"

kj::String computeBundleHash(kj::StringPtr bundlePath);
// Hex SHA-256 of the bundle file.

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_TRANSFER_FILE_H_
