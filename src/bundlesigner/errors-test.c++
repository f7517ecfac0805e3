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

#include "errors.h"
#include "test-util.h"
#include <kj/test.h>
#include <kj/debug.h>

namespace bundlesigner {
namespace {

KJ_TEST("exit codes by error kind") {
  KJ_EXPECT(exitCodeFor(ErrorKind::PARAMETER) == 2);
  KJ_EXPECT(exitCodeFor(ErrorKind::MIN_SDK_VERSION) == 3);
  KJ_EXPECT(exitCodeFor(ErrorKind::INVALID_BUNDLE) == 5);
  KJ_EXPECT(exitCodeFor(ErrorKind::BUNDLE_IO) == 6);
  KJ_EXPECT(exitCodeFor(ErrorKind::MALFORMED_APK) == 7);

  KJ_EXPECT(exitCodeFor(ErrorKind::RUNTIME) == EXIT_RUNTIME_ERROR);
  KJ_EXPECT(exitCodeFor(ErrorKind::IO) == EXIT_RUNTIME_ERROR);
  KJ_EXPECT(exitCodeFor(ErrorKind::FORMAT) == EXIT_RUNTIME_ERROR);
  KJ_EXPECT(exitCodeFor(ErrorKind::CORRELATION) == EXIT_RUNTIME_ERROR);
  KJ_EXPECT(exitCodeFor(ErrorKind::SIGNER) == EXIT_RUNTIME_ERROR);
}

KJ_TEST("BUNDLESIGNER_REQUIRE throws a classified failure") {
  auto kind = expectFailure([]() {
    int variants = 0;
    BUNDLESIGNER_REQUIRE(variants > 0, CORRELATION, "no variants: ", variants);
  });
  KJ_EXPECT(kind == ErrorKind::CORRELATION);

  BUNDLESIGNER_REQUIRE(true, FORMAT, "unreachable");
}

KJ_TEST("Failure is a kj::Exception") {
  bool caught = false;
  try {
    BUNDLESIGNER_FAIL(FORMAT, "line ", 3, " is empty");
  } catch (const kj::Exception& e) {
    caught = true;
    KJ_EXPECT(e.getDescription() == "line 3 is empty", e.getDescription());
    KJ_EXPECT(e.getType() == kj::Exception::Type::FAILED);
  }
  KJ_EXPECT(caught);
}

KJ_TEST("describeFailure") {
  Failure parameter(ErrorKind::PARAMETER, __FILE__, __LINE__, kj::str("Missing bin file"));
  KJ_EXPECT(describeFailure(parameter) == "Missing bin file");

  Failure format(ErrorKind::FORMAT, __FILE__, __LINE__, kj::str("line 2 is empty"));
  KJ_EXPECT(describeFailure(format) == "malformed transfer file: line 2 is empty");

  Failure minSdk(ErrorKind::MIN_SDK_VERSION, __FILE__, __LINE__, kj::str("base.apk"));
  KJ_EXPECT(describeFailure(minSdk).startsWith(
      "Failed to determine APK's minimum supported platform version."));

  kj::Exception plain(kj::Exception::Type::FAILED, __FILE__, __LINE__, kj::str("boom"));
  KJ_EXPECT(describeFailure(plain) == "boom");
}

}  // namespace
}  // namespace bundlesigner
