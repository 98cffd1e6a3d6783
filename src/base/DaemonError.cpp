#include "DaemonError.hpp"

namespace ptykeep {
DaemonError DaemonError::sessionAlreadyExists(const string& sessionId) {
  return DaemonError(DaemonErrorCode::SessionAlreadyExists,
                     "session already exists: " + sessionId);
}

DaemonError DaemonError::sessionNotFound(const string& sessionId) {
  return DaemonError(DaemonErrorCode::SessionNotFound,
                     "session not found: " + sessionId);
}

DaemonError DaemonError::sessionNotRunning(const string& sessionId) {
  return DaemonError(DaemonErrorCode::SessionNotRunning,
                     "session not running: " + sessionId);
}

DaemonError DaemonError::invalidStateTransition(const string& detail) {
  return DaemonError(DaemonErrorCode::InvalidStateTransition,
                     "invalid state transition: " + detail);
}

DaemonError DaemonError::ptyError(const string& detail) {
  return DaemonError(DaemonErrorCode::PtyError, "pty error: " + detail);
}

DaemonError DaemonError::io(const string& detail) {
  return DaemonError(DaemonErrorCode::Io, "io error: " + detail);
}

DaemonError DaemonError::configInvalid(const string& detail) {
  return DaemonError(DaemonErrorCode::ConfigInvalid,
                     "invalid configuration: " + detail);
}

DaemonError DaemonError::protocolError(const string& detail) {
  return DaemonError(DaemonErrorCode::ProtocolError,
                     "protocol error: " + detail);
}

DaemonError DaemonError::alreadyRunning(pid_t pid) {
  return DaemonError(DaemonErrorCode::AlreadyRunning,
                     "daemon already running (pid " + to_string(pid) + ")");
}

string DaemonError::errorCode() const {
  switch (code) {
    case DaemonErrorCode::SessionAlreadyExists:
      return "session_already_exists";
    case DaemonErrorCode::SessionNotFound:
      return "session_not_found";
    case DaemonErrorCode::SessionNotRunning:
      return "session_not_running";
    case DaemonErrorCode::InvalidStateTransition:
      return "invalid_state_transition";
    case DaemonErrorCode::PtyError:
      return "pty_error";
    case DaemonErrorCode::Io:
      return "io_error";
    case DaemonErrorCode::ConfigInvalid:
      return "config_invalid";
    case DaemonErrorCode::ProtocolError:
      return "protocol_error";
    case DaemonErrorCode::AlreadyRunning:
      return "daemon_already_running";
  }
  return "unknown";
}

bool DaemonError::isUserError() const {
  switch (code) {
    case DaemonErrorCode::SessionAlreadyExists:
    case DaemonErrorCode::SessionNotFound:
    case DaemonErrorCode::SessionNotRunning:
    case DaemonErrorCode::AlreadyRunning:
      return true;
    default:
      return false;
  }
}
}  // namespace ptykeep
