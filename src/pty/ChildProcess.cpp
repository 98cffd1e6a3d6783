#include "ChildProcess.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
ChildProcess::ChildProcess(pid_t _pid) : pid(_pid), reaped(false) {}

int ChildProcess::exitCodeFromStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

bool ChildProcess::reapLocked(int options) {
  if (reaped) {
    return true;
  }
  while (true) {
    int status = 0;
    pid_t rc = ::waitpid(pid, &status, options);
    if (rc == pid) {
      reaped = true;
      exitCode = exitCodeFromStatus(status);
      VLOG(1) << "Reaped child " << pid << " with exit code " << *exitCode;
      return true;
    }
    if (rc == 0) {
      return false;
    }
    if (GetErrno() == EINTR) {
      continue;
    }
    // ECHILD: somebody else collected the status, treat it as gone
    LOG(WARNING) << "waitpid failed for " << pid << ": " << strerror(GetErrno());
    reaped = true;
    return true;
  }
}

optional<int> ChildProcess::tryWait() {
  lock_guard<recursive_mutex> guard(childMutex);
  reapLocked(WNOHANG);
  return exitCode;
}

optional<int> ChildProcess::waitFor(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    {
      lock_guard<recursive_mutex> guard(childMutex);
      if (reapLocked(WNOHANG)) {
        return exitCode;
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

optional<int> ChildProcess::wait() {
  lock_guard<recursive_mutex> guard(childMutex);
  reapLocked(0);
  return exitCode;
}

void ChildProcess::kill(int signum) {
  lock_guard<recursive_mutex> guard(childMutex);
  if (reaped) {
    VLOG(1) << "Not signalling " << pid << ", already reaped";
    return;
  }
  if (::kill(pid, signum) == -1 && GetErrno() != ESRCH) {
    throw DaemonError::ptyError("failed to kill process " + to_string(pid) +
                                ": " + strerror(GetErrno()));
  }
}

bool ChildProcess::hasExited() {
  lock_guard<recursive_mutex> guard(childMutex);
  return reapLocked(WNOHANG);
}
}  // namespace ptykeep
