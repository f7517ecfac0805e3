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

#ifndef BUNDLESIGNER_WORKSPACE_H_
#define BUNDLESIGNER_WORKSPACE_H_

#include <kj/string.h>
#include <kj/function.h>
#include <kj/main.h>

namespace bundlesigner {

class Workspace {
  // A private temporary directory for one run. Everything a phase writes besides its final
  // output lives here: rebuilt APK Sets, extracted variants, the running digest logs and the
  // throwaway keystore. The directory is deleted when the Workspace is destroyed.
  //
  // Two phases must not share a Workspace concurrently, since the intermediate file names are
  // fixed.

public:
  explicit Workspace(kj::StringPtr parentDir);
  // Creates `<parentDir>/bundle_signer.XXXXXX`.

  ~Workspace() noexcept(false);
  KJ_DISALLOW_COPY(Workspace);

  kj::StringPtr getPath() const { return path; }

  kj::String file(kj::StringPtr name) const;
  // Path of `name` inside the workspace.

  kj::String freshDirectory(kj::StringPtr name);
  // Create (or empty) the subdirectory `name` and return its path.

  kj::String getV1LogPath() const { return file("binv1"); }
  kj::String getV2V3LogPath() const { return file("binv2_v3"); }
  kj::String getScratchPath() const { return file("tmp_bin"); }
  kj::String getKeystorePath() const { return file("default.keystore"); }

  bool cleanup();
  // Delete the directory now. Returns false (after logging why) if it could not be removed.
  // Calling it again after success is a no-op.

private:
  kj::String path;
  bool released = false;
};

int runInterruptible(kj::ProcessContext& context, kj::Function<int()> phase);
// Run `phase` in a forked child and return its raw wait status. While the child runs, SIGINT,
// SIGTERM, SIGHUP and SIGQUIT delivered to this process are forwarded to it instead of killing
// us, so the caller always regains control to release its Workspace.

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_WORKSPACE_H_
