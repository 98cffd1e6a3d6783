#include "DaemonSession.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
DaemonSession::DaemonSession(const string& _id, const string& _workingDirectory,
                             const string& _command, const string& _createdAt,
                             size_t scrollbackCapacity)
    : id(_id),
      workingDirectory(_workingDirectory),
      command(_command),
      createdAt(_createdAt),
      state(SessionState::Creating),
      scrollback(make_shared<ScrollbackBuffer>(scrollbackCapacity)) {}

void DaemonSession::setRunning(const BroadcastSender& sender, pid_t pid) {
  if (state != SessionState::Creating) {
    throw DaemonError::invalidStateTransition(
        "session " + id + " must be creating to start running, but is " +
        sessionStateToString(state));
  }
  state = SessionState::Running;
  outputSender = sender;
  ptyPid = pid;
}

void DaemonSession::setStopped() {
  switch (state) {
    case SessionState::Stopped:
      return;
    case SessionState::Creating:
    case SessionState::Running:
      break;
  }
  state = SessionState::Stopped;
  outputSender.reset();
  ptyPid.reset();
}

void DaemonSession::attachClient(ClientId clientId) {
  attachedClients.insert(clientId);
}

void DaemonSession::detachClient(ClientId clientId) {
  attachedClients.erase(clientId);
}

optional<BroadcastReceiver> DaemonSession::subscribeOutput() {
  if (state != SessionState::Running || !outputSender) {
    return std::nullopt;
  }
  return outputSender->subscribe();
}

optional<BroadcastSender> DaemonSession::takeOutputSender() {
  optional<BroadcastSender> sender = std::move(outputSender);
  outputSender.reset();
  return sender;
}

SessionInfo DaemonSession::toSessionInfo() const {
  SessionInfo info;
  info.id = id;
  info.workingDirectory = workingDirectory;
  info.command = command;
  info.status = sessionStateToString(state);
  info.createdAt = createdAt;
  info.clientCount = attachedClients.size();
  if (ptyPid) {
    info.ptyPid = *ptyPid;
  }
  info.exitCode = exitCode;
  info.projectId = projectId;
  info.agent = agent;
  info.note = note;
  return info;
}
}  // namespace ptykeep
