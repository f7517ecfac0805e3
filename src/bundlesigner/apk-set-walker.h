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

#ifndef BUNDLESIGNER_APK_SET_WALKER_H_
#define BUNDLESIGNER_APK_SET_WALKER_H_

#include <kj/string.h>
#include <kj/array.h>
#include <kj/common.h>

namespace bundlesigner {

struct ExtractedVariant {
  kj::String entryPath;
  // Path of the entry inside the archive, e.g. "splits/base-master.apk".

  kj::String name;
  // Normalized variant name, e.g. "splits_base-master.apk". This is the key shared by both phases.

  kj::String path;
  // Where the entry's bytes were written.
};

class ApkSetWalker {
  // Walks the APK entries of an APK Set archive in archive order, extracting each one just before
  // it is returned. Entries whose path doesn't mention ".apk" (toc.pb, directories) are skipped
  // without extraction. The walk can't be restarted; make a new walker instead.
  //
  // Extraction streams each entry through `unzip -p` so the archive is never held in memory.

public:
  ApkSetWalker(kj::StringPtr archivePath, kj::StringPtr workDir);
  KJ_DISALLOW_COPY(ApkSetWalker);

  kj::Maybe<ExtractedVariant> next();
  // Extract and return the next APK entry, or null when the archive is exhausted. Throws
  // Failure(IO) if the archive can't be read or an entry can't be written; the walk is over
  // after a throw.

private:
  kj::String archivePath;
  kj::String workDir;
  kj::Maybe<kj::Array<kj::String>> entries;
  size_t position = 0;

  kj::Array<kj::String> listEntries();
  void extractEntry(kj::StringPtr entryPath, kj::StringPtr destination);
};

bool isApkEntry(kj::StringPtr entryPath);

kj::String variantNameForEntry(kj::StringPtr entryPath);
// Cut the path right after its first ".apk" and replace '/' with '_'.

kj::String outputNameForEntry(kj::StringPtr entryPath);
// File name of the signed result. Universal APKs keep their own name; split APKs get their
// configuration directory as a prefix ("arm64-v8a/base.apk" -> "arm64-v8a_base.apk") so that
// same-named leaves from different configurations don't collide.

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_APK_SET_WALKER_H_
