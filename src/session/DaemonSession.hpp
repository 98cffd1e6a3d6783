#ifndef __PTYKEEP_DAEMON_SESSION__
#define __PTYKEEP_DAEMON_SESSION__

#include "BroadcastChannel.hpp"
#include "Headers.hpp"
#include "ScrollbackBuffer.hpp"
#include "SessionInfo.hpp"

namespace ptykeep {
/**
 * @brief One session: static metadata, lifecycle state, attached clients,
 * scrollback and (while running) the output channel.
 *
 * Lifecycle is Creating -> Running -> Stopped. The output sender and the pid
 * are present exactly while the state is Running. Only the SessionManager
 * mutates sessions.
 */
class DaemonSession {
 public:
  DaemonSession(const string& _id, const string& _workingDirectory,
                const string& _command, const string& _createdAt,
                size_t scrollbackCapacity);

  /**
   * @brief Creating -> Running. Stores the output sender and child pid.
   * @throws DaemonError InvalidStateTransition from any other state.
   */
  void setRunning(const BroadcastSender& sender, pid_t pid);

  /**
   * @brief Running or Creating -> Stopped, dropping the output sender and
   * pid. A no-op when already stopped. Scrollback and exit code survive.
   */
  void setStopped();

  /** @brief Idempotent; valid in every state. */
  void attachClient(ClientId clientId);

  /** @brief Idempotent; valid in every state. */
  void detachClient(ClientId clientId);

  /** @brief A new receiver on the output channel, or nullopt unless running. */
  optional<BroadcastReceiver> subscribeOutput();

  /** @brief The whole scrollback; still available once stopped. */
  string scrollbackContents() const { return scrollback->contents(); }

  shared_ptr<ScrollbackBuffer> getScrollback() { return scrollback; }

  SessionInfo toSessionInfo() const;

  const string& getId() const { return id; }
  const string& getWorkingDirectory() const { return workingDirectory; }
  const string& getCommand() const { return command; }
  const string& getCreatedAt() const { return createdAt; }
  SessionState getState() const { return state; }
  bool isRunning() const { return state == SessionState::Running; }
  bool hasOutput() const { return bool(outputSender); }
  optional<pid_t> getPtyPid() const { return ptyPid; }
  optional<int> getExitCode() const { return exitCode; }
  void setExitCode(int code) { exitCode = code; }
  const set<ClientId>& getAttachedClients() const { return attachedClients; }
  size_t clientCount() const { return attachedClients.size(); }

  /** @brief Detaches the output sender, leaving the state untouched. */
  optional<BroadcastSender> takeOutputSender();

  optional<string> projectId;
  optional<string> agent;
  optional<string> note;

 protected:
  string id;
  string workingDirectory;
  string command;
  string createdAt;
  SessionState state;
  optional<BroadcastSender> outputSender;
  shared_ptr<ScrollbackBuffer> scrollback;
  set<ClientId> attachedClients;
  optional<pid_t> ptyPid;
  optional<int> exitCode;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_DAEMON_SESSION__
