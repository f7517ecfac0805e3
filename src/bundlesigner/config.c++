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

#include "config.h"
#include "errors.h"
#include "util.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <stdlib.h>

namespace bundlesigner {

kj::Array<kj::String> splitCommand(kj::StringPtr value) {
  auto parts = splitSpace(value);
  auto result = kj::heapArrayBuilder<kj::String>(parts.size());
  for (auto& part: parts) {
    result.add(kj::heapString(part));
  }
  return result.finish();
}

Config defaultConfig() {
  Config config;
  config.bundletool = splitCommand("bundletool");
  config.keytool = splitCommand("keytool");
  config.signerTool = splitCommand("apksigner-detached");
  config.apksigner = splitCommand("apksigner");

  const char* tmpdir = getenv("TMPDIR");
  if (tmpdir == nullptr || *tmpdir == '\0') {
    config.tmpDir = kj::str("/tmp");
  } else {
    config.tmpDir = kj::str(tmpdir);
  }
  return config;
}

Config readConfig(kj::StringPtr path) {
  Config config = defaultConfig();

  auto lines = splitLines(readAll(path));
  for (auto& line: lines) {
    auto equalsPos = KJ_REQUIRE_NONNULL(line.findFirst('='), "Invalid config line", path, line);
    auto key = trim(line.slice(0, equalsPos));
    auto value = trim(line.slice(equalsPos + 1));

    if (key == "BUNDLETOOL" || key == "KEYTOOL" || key == "SIGNER_TOOL" || key == "APKSIGNER") {
      auto command = splitCommand(value);
      KJ_REQUIRE(command.size() > 0, "config value must name a program", key);
      if (key == "BUNDLETOOL") {
        config.bundletool = kj::mv(command);
      } else if (key == "KEYTOOL") {
        config.keytool = kj::mv(command);
      } else if (key == "SIGNER_TOOL") {
        config.signerTool = kj::mv(command);
      } else {
        config.apksigner = kj::mv(command);
      }
    } else if (key == "TMPDIR") {
      KJ_REQUIRE(isDirectory(value), "TMPDIR is not a directory", value);
      config.tmpDir = kj::mv(value);
    } else {
      KJ_LOG(WARNING, "Ignoring unrecognized config option", key);
    }
  }

  return config;
}

Config loadConfig(kj::Maybe<kj::StringPtr> explicitPath) {
  KJ_IF_MAYBE(path, explicitPath) {
    BUNDLESIGNER_REQUIRE(fileExists(*path), PARAMETER, "Config file does not exist: ", *path);
    return readConfig(*path);
  }

  const char* fromEnv = getenv("BUNDLESIGNER_CONFIG");
  if (fromEnv != nullptr && *fromEnv != '\0') {
    BUNDLESIGNER_REQUIRE(fileExists(fromEnv), PARAMETER,
        "Config file named by BUNDLESIGNER_CONFIG does not exist: ", fromEnv);
    return readConfig(fromEnv);
  }

  const char* home = getenv("HOME");
  if (home != nullptr && *home != '\0') {
    auto path = kj::str(home, "/.bundlesigner.conf");
    if (fileExists(path)) {
      return readConfig(path);
    }
  }

  return defaultConfig();
}

}  // namespace bundlesigner
