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

#ifndef BUNDLESIGNER_CONFIG_H_
#define BUNDLESIGNER_CONFIG_H_

#include <kj/string.h>
#include <kj/array.h>

namespace bundlesigner {

struct Config {
  // External programs, each an argv prefix so that e.g. `java -jar bundletool.jar` works.
  kj::Array<kj::String> bundletool;
  kj::Array<kj::String> keytool;
  kj::Array<kj::String> signerTool;
  kj::Array<kj::String> apksigner;

  kj::String tmpDir;
  // Parent of each run's workspace.
};

Config defaultConfig();
// Tools looked up on PATH, workspaces under $TMPDIR or /tmp.

Config readConfig(kj::StringPtr path);
// Read a KEY=VALUE config file on top of the defaults. Throws if the file can't be read or a
// line has no '='.

Config loadConfig(kj::Maybe<kj::StringPtr> explicitPath);
// Use `explicitPath` if given, else $BUNDLESIGNER_CONFIG, else ~/.bundlesigner.conf if it
// exists, else the defaults. An explicitly named file must exist.

kj::Array<kj::String> splitCommand(kj::StringPtr value);

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_CONFIG_H_
