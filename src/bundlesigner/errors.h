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

#ifndef BUNDLESIGNER_ERRORS_H_
#define BUNDLESIGNER_ERRORS_H_

#include <kj/exception.h>
#include <kj/string.h>

namespace bundlesigner {

enum class ErrorKind {
  PARAMETER,
  // Missing or contradictory command-line input.

  MIN_SDK_VERSION,
  // The signer could not determine an APK's minimum platform version.

  RUNTIME,
  INVALID_BUNDLE,
  // The bundle tool rejected the bundle's structure.

  BUNDLE_IO,
  // The bundle tool failed for any other reason.

  MALFORMED_APK,
  IO,
  FORMAT,
  // Malformed transfer file.

  CORRELATION,
  // A rebuilt variant doesn't line up with what the transfer file recorded.

  SIGNER
  // The external signer failed or returned something unusable.
};

kj::StringPtr KJ_STRINGIFY(ErrorKind kind);

class Failure: public kj::Exception {
  // A kj::Exception which also says which class of problem occurred, so that the command line
  // front-end can choose an exit code. Anything thrown as a plain kj::Exception is treated as
  // ErrorKind::RUNTIME.

public:
  Failure(ErrorKind kind, const char* file, int line, kj::String description);

  ErrorKind getKind() const { return kind; }

private:
  ErrorKind kind;
};

#define BUNDLESIGNER_FAIL(kind, ...) \
  throw ::bundlesigner::Failure(::bundlesigner::ErrorKind::kind, __FILE__, __LINE__, \
                                ::kj::str(__VA_ARGS__))

#define BUNDLESIGNER_REQUIRE(condition, kind, ...) \
  if (KJ_LIKELY(condition)) {} else BUNDLESIGNER_FAIL(kind, __VA_ARGS__)

// Process exit codes.
constexpr int EXIT_VERIFICATION_FAILED = 1;
constexpr int EXIT_PARAMETER_ERROR = 2;
constexpr int EXIT_MIN_SDK_VERSION_ERROR = 3;
constexpr int EXIT_RUNTIME_ERROR = 4;
constexpr int EXIT_INVALID_BUNDLE = 5;
constexpr int EXIT_BUNDLE_IO_ERROR = 6;
constexpr int EXIT_MALFORMED_APK = 7;
constexpr int EXIT_CLEANUP_FAILED = 8;

int exitCodeFor(ErrorKind kind);

kj::String describeFailure(const Failure& failure);
kj::String describeFailure(const kj::Exception& exception);
// The message shown to the user for an exception that ends the run. Overload resolution is
// static, so catch Failure separately from kj::Exception.

}  // namespace bundlesigner

#endif  // BUNDLESIGNER_ERRORS_H_
