#include "SessionManager.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
namespace {
string nowRfc3339() {
  auto now = std::chrono::system_clock::now();
  time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;
  struct tm utc;
  gmtime_r(&seconds, &utc);
  char buffer[64];
  strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  char result[80];
  snprintf(result, sizeof(result), "%s.%03dZ", buffer, int(millis));
  return string(result);
}
}  // namespace

SessionManager::SessionManager(const DaemonConfig& _config,
                               shared_ptr<PtyExitQueue> _exitQueue)
    : config(_config),
      exitQueue(_exitQueue),
      clientIdCounter(1),
      readerIdCounter(0) {}

SessionManager::~SessionManager() {
  for (auto& it : readers) {
    it.second->stop();
  }
  for (auto& reader : retiredReaders) {
    reader->stop();
  }
  readers.clear();
  retiredReaders.clear();
}

shared_ptr<DaemonSession> SessionManager::findSession(
    const string& sessionId) const {
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    throw DaemonError::sessionNotFound(sessionId);
  }
  return it->second;
}

SessionInfo SessionManager::createSession(const CreateSessionRequest& request) {
  const string& sessionId = request.sessionId;
  if (sessions.find(sessionId) != sessions.end()) {
    throw DaemonError::sessionAlreadyExists(sessionId);
  }
  LOG(INFO) << "Creating session " << sessionId << ": " << request.command
            << " in " << request.workingDirectory;

  auto session = make_shared<DaemonSession>(
      sessionId, request.workingDirectory, request.command, nowRfc3339(),
      config.scrollbackBufferSize);
  session->projectId = request.projectId;
  session->agent = request.agent;
  session->note = request.note;

  uint16_t rows = request.rows.value_or(config.defaultRows);
  uint16_t cols = request.cols.value_or(config.defaultCols);
  shared_ptr<ManagedPty> pty;
  int readerFd = -1;
  try {
    pty = ptyManager.create(sessionId, request.command, request.args,
                            request.workingDirectory, rows, cols, request.env);
    readerFd = pty->tryCloneReader();
  } catch (const DaemonError& de) {
    LOG(WARNING) << "Failed to create session " << sessionId << ": "
                 << de.what();
    session->setStopped();
    if (pty) {
      ptyManager.destroy(sessionId);
    }
    throw;
  }

  BroadcastSender sender(config.broadcastCapacity);
  auto reader = make_shared<PtyOutputReader>(
      ++readerIdCounter, sessionId, readerFd, session->getScrollback(), sender,
      pty->getChild(), exitQueue);
  reader->start();
  readers[sessionId] = reader;

  session->setRunning(sender, pty->childProcessId());
  sessions[sessionId] = session;
  LOG(INFO) << "Session " << sessionId << " running with pid "
            << pty->childProcessId();
  return session->toSessionInfo();
}

BroadcastReceiver SessionManager::attachClient(const string& sessionId,
                                               ClientId clientId,
                                               string* replay) {
  auto session = findSession(sessionId);
  if (!session->isRunning()) {
    throw DaemonError::sessionNotRunning(sessionId);
  }
  optional<BroadcastReceiver> receiver;
  {
    // The reader pushes and broadcasts under this lock
    auto scrollback = session->getScrollback();
    lock_guard<recursive_mutex> guard(scrollback->getMutex());
    if (replay) {
      *replay = scrollback->contents();
    }
    receiver = session->subscribeOutput();
  }
  if (!receiver) {
    throw DaemonError::sessionNotRunning(sessionId);
  }
  session->attachClient(clientId);
  VLOG(1) << "Client " << clientId << " attached to " << sessionId << " ("
          << session->clientCount() << " clients)";
  return std::move(*receiver);
}

optional<BroadcastReceiver> SessionManager::subscribeOutput(
    const string& sessionId) {
  return findSession(sessionId)->subscribeOutput();
}

void SessionManager::detachClient(const string& sessionId, ClientId clientId) {
  auto session = findSession(sessionId);
  session->detachClient(clientId);
  VLOG(1) << "Client " << clientId << " detached from " << sessionId << " ("
          << session->clientCount() << " clients)";
}

void SessionManager::resizePty(const string& sessionId, uint16_t rows,
                               uint16_t cols) {
  findSession(sessionId);
  auto pty = ptyManager.get(sessionId);
  if (!pty) {
    throw DaemonError::sessionNotFound(sessionId);
  }
  pty->resize(rows, cols);
  VLOG(1) << "Resized " << sessionId << " to " << rows << "x" << cols;
}

void SessionManager::writeStdin(const string& sessionId, const string& data) {
  findSession(sessionId);
  auto pty = ptyManager.get(sessionId);
  if (!pty) {
    throw DaemonError::sessionNotFound(sessionId);
  }
  pty->writeStdin(data);
}

void SessionManager::stopSession(const string& sessionId) {
  auto session = findSession(sessionId);
  auto exitCode = ptyManager.destroy(sessionId);
  retireReader(sessionId);
  if (exitCode) {
    session->setExitCode(*exitCode);
  }
  session->setStopped();
  LOG(INFO) << "Stopped session " << sessionId;
}

void SessionManager::destroySession(const string& sessionId) {
  auto session = findSession(sessionId);
  try {
    ptyManager.destroy(sessionId);
  } catch (const DaemonError& de) {
    // Already exited or stopped
    VLOG(1) << "No pty to kill while destroying " << sessionId << ": "
            << de.what();
  }
  retireReader(sessionId);
  session->setStopped();
  sessions.erase(sessionId);
  LOG(INFO) << "Destroyed session " << sessionId;
}

optional<BroadcastSender> SessionManager::handlePtyExit(
    const PtyExitEvent& event) {
  auto readerIt = readers.find(event.sessionId);
  if (readerIt == readers.end() ||
      readerIt->second->getId() != event.readerId) {
    VLOG(1) << "Ignoring stale exit event for " << event.sessionId;
    return std::nullopt;
  }
  retiredReaders.push_back(readerIt->second);
  readers.erase(readerIt);
  ptyManager.remove(event.sessionId);

  auto it = sessions.find(event.sessionId);
  if (it == sessions.end()) {
    return std::nullopt;
  }
  auto session = it->second;
  if (event.exitCode) {
    session->setExitCode(*event.exitCode);
  }
  auto sender = session->takeOutputSender();
  session->setStopped();
  LOG(INFO) << "Session " << event.sessionId << " exited with code "
            << (event.exitCode ? to_string(*event.exitCode) : "unknown");
  return sender;
}

int SessionManager::processExitEvents() {
  int processed = 0;
  for (const auto& event : exitQueue->drain()) {
    // Dropping the detached sender closes the channel once the reader's
    // own sender is gone too; subscribers then see the stop.
    handlePtyExit(event);
    processed++;
  }
  reapReaders();
  return processed;
}

vector<SessionInfo> SessionManager::listSessions(
    const optional<string>& projectFilter) const {
  vector<SessionInfo> infos;
  for (const auto& it : sessions) {
    if (projectFilter && it.second->projectId != projectFilter) {
      continue;
    }
    infos.push_back(it.second->toSessionInfo());
  }
  return infos;
}

optional<SessionInfo> SessionManager::getSession(
    const string& sessionId) const {
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return std::nullopt;
  }
  return it->second->toSessionInfo();
}

string SessionManager::scrollbackContents(const string& sessionId) const {
  return findSession(sessionId)->scrollbackContents();
}

void SessionManager::detachClientFromAll(ClientId clientId) {
  for (auto& it : sessions) {
    it.second->detachClient(clientId);
  }
  VLOG(1) << "Client " << clientId << " detached from all sessions";
}

void SessionManager::stopAll() {
  vector<string> running;
  for (const auto& it : sessions) {
    if (it.second->isRunning()) {
      running.push_back(it.first);
    }
  }
  LOG(INFO) << "Stopping " << running.size() << " running sessions";
  for (const auto& sessionId : running) {
    try {
      stopSession(sessionId);
    } catch (const DaemonError& de) {
      LOG(WARNING) << "Failed to stop " << sessionId << ": " << de.what();
    }
  }
  reapReaders();
}

void SessionManager::retireReader(const string& sessionId) {
  auto it = readers.find(sessionId);
  if (it == readers.end()) {
    return;
  }
  it->second->stop();
  retiredReaders.push_back(it->second);
  readers.erase(it);
}

void SessionManager::reapReaders() {
  auto it = retiredReaders.begin();
  while (it != retiredReaders.end()) {
    if ((*it)->isFinished()) {
      (*it)->join();
      it = retiredReaders.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace ptykeep
