#ifndef __PTYKEEP_DAEMON_ERROR__
#define __PTYKEEP_DAEMON_ERROR__

#include "Headers.hpp"

namespace ptykeep {
enum class DaemonErrorCode {
  SessionAlreadyExists,
  SessionNotFound,
  SessionNotRunning,
  InvalidStateTransition,
  PtyError,
  Io,
  ConfigInvalid,
  ProtocolError,
  AlreadyRunning,
};

/**
 * @brief Recoverable error raised by the PTY and session managers.
 *
 * Connection handlers catch these and turn them into protocol-level error
 * responses; none of them end a connection or the daemon.
 */
class DaemonError : public std::runtime_error {
 public:
  DaemonError(DaemonErrorCode _code, const string& message)
      : std::runtime_error(message), code(_code) {}

  static DaemonError sessionAlreadyExists(const string& sessionId);
  static DaemonError sessionNotFound(const string& sessionId);
  static DaemonError sessionNotRunning(const string& sessionId);
  static DaemonError invalidStateTransition(const string& detail);
  static DaemonError ptyError(const string& detail);
  static DaemonError io(const string& detail);
  static DaemonError configInvalid(const string& detail);
  static DaemonError protocolError(const string& detail);
  static DaemonError alreadyRunning(pid_t pid);

  DaemonErrorCode getCode() const { return code; }

  /** @brief Stable snake_case code sent in `error` responses. */
  string errorCode() const;

  /**
   * @brief True for errors caused by the caller (unknown or duplicate ids,
   * stopped sessions) rather than by the daemon or the OS.
   */
  bool isUserError() const;

 protected:
  DaemonErrorCode code;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_DAEMON_ERROR__
