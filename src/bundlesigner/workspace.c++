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

#include "workspace.h"
#include "util.h"
#include <kj/async-unix.h>
#include <kj/debug.h>
#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bundlesigner {

static const int FORWARDED_SIGNALS[] = { SIGINT, SIGQUIT, SIGTERM, SIGHUP };

Workspace::Workspace(kj::StringPtr parentDir) {
  auto pathTemplate = kj::str(parentDir, "/bundle_signer.XXXXXX");
  if (mkdtemp(pathTemplate.begin()) == nullptr) {
    KJ_FAIL_SYSCALL("mkdtemp", errno, pathTemplate);
  }
  path = kj::mv(pathTemplate);
  KJ_LOG(INFO, "created workspace", path);
}

Workspace::~Workspace() noexcept(false) {
  if (!released) {
    cleanup();
  }
}

kj::String Workspace::file(kj::StringPtr name) const {
  return kj::str(path, "/", name);
}

kj::String Workspace::freshDirectory(kj::StringPtr name) {
  auto result = file(name);
  if (access(result.cStr(), F_OK) == 0) {
    recursivelyDelete(result);
  }
  KJ_SYSCALL(mkdir(result.cStr(), 0777), result);
  return result;
}

bool Workspace::cleanup() {
  if (released) return true;

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    recursivelyDelete(path);
  })) {
    KJ_LOG(ERROR, "Failed to remove tmp dir.", path, *exception);
    return false;
  }

  released = true;
  return true;
}

// =======================================================================================

static kj::Promise<int> onChildExit(kj::UnixEventPort& eventPort, pid_t pid) {
  int status;
  int waitResult;
  KJ_SYSCALL(waitResult = waitpid(pid, &status, WNOHANG));
  if (waitResult == 0) {
    return eventPort.onSignal(SIGCHLD).then([&eventPort,pid](siginfo_t&& info) {
      return onChildExit(eventPort, pid);
    });
  } else {
    return status;
  }
}

static kj::Promise<void> forwardSignals(kj::UnixEventPort& eventPort,
                                        kj::ProcessContext& context, Subprocess& child) {
  return eventPort.onSignal(SIGINT)
      .exclusiveJoin(eventPort.onSignal(SIGQUIT))
      .exclusiveJoin(eventPort.onSignal(SIGTERM))
      .exclusiveJoin(eventPort.onSignal(SIGHUP))
      .then([&eventPort,&context,&child](siginfo_t&& sig) {
    context.warning(kj::str("Stopping due to signal: ", strsignal(sig.si_signo)));
    child.signal(sig.si_signo);
    return forwardSignals(eventPort, context, child);
  });
}

int runInterruptible(kj::ProcessContext& context, kj::Function<int()> phase) {
  // Block the signals before forking so that none can slip in between.
  for (int signo: FORWARDED_SIGNALS) {
    kj::UnixEventPort::captureSignal(signo);
  }
  kj::UnixEventPort::captureSignal(SIGCHLD);

  Subprocess child([&]() -> int {
    // The child takes the default action for every signal we forward to it.
    for (int signo: FORWARDED_SIGNALS) {
      ::signal(signo, SIG_DFL);
    }
    ::signal(SIGCHLD, SIG_DFL);
    sigset_t sigmask;
    sigemptyset(&sigmask);
    KJ_SYSCALL(sigprocmask(SIG_SETMASK, &sigmask, nullptr));

    return phase();
  });

  kj::UnixEventPort eventPort;
  kj::EventLoop loop(eventPort);
  kj::WaitScope waitScope(loop);

  auto forwarding = forwardSignals(eventPort, context, child).eagerlyEvaluate(nullptr);
  int status = onChildExit(eventPort, child.getPid()).wait(waitScope);
  child.notifyExited();
  return status;
}

}  // namespace bundlesigner
