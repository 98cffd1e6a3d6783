#ifndef __PTYKEEP_CHILD_PROCESS__
#define __PTYKEEP_CHILD_PROCESS__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief A spawned child process that is reaped exactly once.
 *
 * Shared between the PTY handle (which kills it) and the output reader
 * (which collects the exit status once the PTY reaches EOF). The pid is never
 * signalled after it has been reaped.
 */
class ChildProcess {
 public:
  explicit ChildProcess(pid_t _pid);

  pid_t getPid() const { return pid; }

  /** @brief Reaps the child if it has exited, without blocking. */
  optional<int> tryWait();

  /**
   * @brief Polls for the exit for up to `timeout`.
   * @return The exit code, or nullopt if the child is still running or its
   * status could not be collected.
   */
  optional<int> waitFor(std::chrono::milliseconds timeout);

  /** @brief Blocks until the child exits. */
  optional<int> wait();

  /** @brief Sends `signum` unless the child was already reaped. */
  void kill(int signum = SIGKILL);

  bool hasExited();

  /** @brief Exit code for a waitpid() status; 128+N for signal N. */
  static int exitCodeFromStatus(int status);

 protected:
  bool reapLocked(int options);

  pid_t pid;
  recursive_mutex childMutex;
  bool reaped;
  optional<int> exitCode;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_CHILD_PROCESS__
