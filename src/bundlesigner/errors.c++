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
#include <kj/debug.h>

namespace bundlesigner {

kj::StringPtr KJ_STRINGIFY(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PARAMETER: return "parameter error";
    case ErrorKind::MIN_SDK_VERSION: return "min SDK version error";
    case ErrorKind::RUNTIME: return "runtime error";
    case ErrorKind::INVALID_BUNDLE: return "invalid bundle";
    case ErrorKind::BUNDLE_IO: return "bundle tool I/O error";
    case ErrorKind::MALFORMED_APK: return "malformed APK";
    case ErrorKind::IO: return "I/O error";
    case ErrorKind::FORMAT: return "malformed transfer file";
    case ErrorKind::CORRELATION: return "correlation error";
    case ErrorKind::SIGNER: return "signer error";
  }
  KJ_UNREACHABLE;
}

Failure::Failure(ErrorKind kind, const char* file, int line, kj::String description)
    : kj::Exception(kj::Exception::Type::FAILED, file, line, kj::mv(description)),
      kind(kind) {}

int exitCodeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PARAMETER: return EXIT_PARAMETER_ERROR;
    case ErrorKind::MIN_SDK_VERSION: return EXIT_MIN_SDK_VERSION_ERROR;
    case ErrorKind::INVALID_BUNDLE: return EXIT_INVALID_BUNDLE;
    case ErrorKind::BUNDLE_IO: return EXIT_BUNDLE_IO_ERROR;
    case ErrorKind::MALFORMED_APK: return EXIT_MALFORMED_APK;

    case ErrorKind::RUNTIME:
    case ErrorKind::IO:
    case ErrorKind::FORMAT:
    case ErrorKind::CORRELATION:
    case ErrorKind::SIGNER:
      return EXIT_RUNTIME_ERROR;
  }
  KJ_UNREACHABLE;
}

kj::String describeFailure(const Failure& failure) {
  switch (failure.getKind()) {
    case ErrorKind::MIN_SDK_VERSION:
      return kj::str("Failed to determine APK's minimum supported platform version. "
                     "Use --min-sdk-version to override (", failure.getDescription(), ")");
    case ErrorKind::PARAMETER:
      return kj::heapString(failure.getDescription());
    default:
      return kj::str(failure.getKind(), ": ", failure.getDescription());
  }
}

kj::String describeFailure(const kj::Exception& exception) {
  return kj::heapString(exception.getDescription());
}

}  // namespace bundlesigner
