#include "ClientConnectionHandler.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
namespace {
string getLoginShell() {
  const char* shell = getenv("SHELL");
  if (shell && shell[0] == '/') {
    return shell;
  }
  struct passwd* pwent = getpwuid(getuid());
  if (pwent && pwent->pw_shell && pwent->pw_shell[0] == '/') {
    return pwent->pw_shell;
  }
  return "/bin/sh";
}
}  // namespace

ClientConnectionHandler::ClientConnectionHandler(
    shared_ptr<DaemonContext> _context, shared_ptr<LineConnection> _connection)
    : context(_context), connection(_connection) {
  clientId = context->getSessionManager().nextClientId();
}

ClientConnectionHandler::~ClientConnectionHandler() {
  // Forwarders write to the connection, stop them first
  streams.clear();
}

void ClientConnectionHandler::run(const string& firstLine) {
  VLOG(1) << "Client " << clientId << " connected on fd "
          << connection->getSocketFd();
  try {
    handleLine(firstLine);
    string line;
    while (!context->isShuttingDown() && !connection->isWriteFailed()) {
      int rc = connection->readLine(&line, 10 * 1000);
      if (rc < 0) {
        break;
      }
      if (rc > 0) {
        handleLine(line);
      }
    }
  } catch (const std::runtime_error& re) {
    VLOG(1) << "Client " << clientId << " connection failed: " << re.what();
  }
  teardown();
  VLOG(1) << "Client " << clientId << " disconnected";
}

void ClientConnectionHandler::handleLine(const string& line) {
  if (line.find_first_not_of(" \t\r") == string::npos) {
    return;
  }

  optional<ClientMessage> message;
  try {
    message = parseClientMessage(line);
  } catch (const DaemonError& de) {
    LOG(WARNING) << "Client " << clientId
                 << " sent a malformed request: " << de.what();
    auto id = recoverRequestId(line);
    if (id) {
      send(ErrorMessage{*id, de.errorCode(), de.what()});
    }
    return;
  }

  VLOG(2) << "Client " << clientId << " request "
          << messageTypeOf(*message) << " (" << requestIdOf(*message) << ")";
  try {
    handleMessage(*message);
  } catch (const DaemonError& de) {
    if (de.isUserError()) {
      VLOG(1) << messageTypeOf(*message) << " failed: " << de.what();
    } else {
      LOG(WARNING) << messageTypeOf(*message) << " failed: " << de.what();
    }
    send(ErrorMessage{requestIdOf(*message), de.errorCode(), de.what()});
  }
}

void ClientConnectionHandler::handleMessage(const ClientMessage& message) {
  std::visit(
      [this](const auto& m) {
        typedef std::decay_t<decltype(m)> T;
        if constexpr (std::is_same_v<T, CreateSessionMessage>) {
          send(createSession(m));
        } else if constexpr (std::is_same_v<T, AttachMessage>) {
          attach(m);
        } else if constexpr (std::is_same_v<T, DetachMessage>) {
          {
            auto lock = context->writeLock();
            context->getSessionManager().detachClient(m.sessionId, clientId);
          }
          stopStream(m.sessionId);
          send(AckMessage{m.id});
        } else if constexpr (std::is_same_v<T, ResizePtyMessage>) {
          {
            auto lock = context->writeLock();
            context->getSessionManager().resizePty(m.sessionId, m.rows,
                                                   m.cols);
          }
          send(AckMessage{m.id});
        } else if constexpr (std::is_same_v<T, WriteStdinMessage>) {
          {
            auto lock = context->writeLock();
            context->getSessionManager().writeStdin(m.sessionId, m.data);
          }
          send(AckMessage{m.id});
        } else if constexpr (std::is_same_v<T, StopSessionMessage>) {
          {
            auto lock = context->writeLock();
            context->getSessionManager().stopSession(m.sessionId);
          }
          send(AckMessage{m.id});
        } else if constexpr (std::is_same_v<T, DestroySessionMessage>) {
          {
            auto lock = context->writeLock();
            context->getSessionManager().destroySession(m.sessionId);
          }
          send(AckMessage{m.id});
        } else if constexpr (std::is_same_v<T, ListSessionsMessage>) {
          SessionListMessage response;
          response.id = m.id;
          {
            auto lock = context->readLock();
            response.sessions =
                context->getSessionManager().listSessions(m.projectId);
          }
          send(response);
        } else if constexpr (std::is_same_v<T, GetSessionMessage>) {
          optional<SessionInfo> info;
          {
            auto lock = context->readLock();
            info = context->getSessionManager().getSession(m.sessionId);
          }
          if (!info) {
            throw DaemonError::sessionNotFound(m.sessionId);
          }
          send(SessionInfoMessage{m.id, *info});
        } else if constexpr (std::is_same_v<T, ReadScrollbackMessage>) {
          string data;
          {
            auto lock = context->readLock();
            data = context->getSessionManager().scrollbackContents(m.sessionId);
          }
          send(ScrollbackContentsMessage{m.id, data});
        } else if constexpr (std::is_same_v<T, DaemonStopMessage>) {
          LOG(INFO) << "Client " << clientId << " asked the daemon to stop";
          send(AckMessage{m.id});
          context->requestShutdown();
        } else if constexpr (std::is_same_v<T, PingMessage>) {
          send(AckMessage{m.id});
        }
      },
      message);
}

SessionCreatedMessage ClientConnectionHandler::createSession(
    const CreateSessionMessage& m) {
  CreateSessionRequest request;
  request.sessionId = m.sessionId;
  request.workingDirectory = m.workingDirectory;
  if (m.useLoginShell) {
    request.command = getLoginShell();
    request.args = {"-l"};
  } else {
    request.command = m.command;
    request.args = m.args;
  }
  request.env = m.envVars;
  request.rows = m.rows;
  request.cols = m.cols;
  request.projectId = m.projectId;
  request.agent = m.agent;
  request.note = m.note;

  auto lock = context->writeLock();
  return SessionCreatedMessage{
      m.id, context->getSessionManager().createSession(request)};
}

void ClientConnectionHandler::attach(const AttachMessage& m) {
  // Re-attaching replaces the previous stream for this session
  stopStream(m.sessionId);

  string replay;
  optional<BroadcastReceiver> receiver;
  {
    auto lock = context->writeLock();
    auto& sessionManager = context->getSessionManager();
    receiver = sessionManager.attachClient(m.sessionId, clientId, &replay);
    if (m.rows > 0 && m.cols > 0) {
      try {
        sessionManager.resizePty(m.sessionId, m.rows, m.cols);
      } catch (const DaemonError&) {
        sessionManager.detachClient(m.sessionId, clientId);
        throw;
      }
    }
  }

  send(AckMessage{m.id});
  if (!replay.empty()) {
    send(PtyOutputMessage{m.sessionId, replay});
  }
  startStream(m.sessionId, std::move(*receiver));
}

void ClientConnectionHandler::startStream(const string& sessionId,
                                          BroadcastReceiver receiver) {
  auto weakConnection = weak_ptr<LineConnection>(connection);
  auto sharedContext = context;
  auto forwarder = make_shared<OutputForwarder>(
      sessionId, std::move(receiver),
      [weakConnection, sessionId](const string& data) {
        auto conn = weakConnection.lock();
        if (conn) {
          conn->writeLine(
              daemonMessageToJson(PtyOutputMessage{sessionId, data}).dump());
        }
      },
      [weakConnection, sessionId](uint64_t bytesDropped) {
        auto conn = weakConnection.lock();
        if (conn) {
          conn->writeLine(daemonMessageToJson(PtyOutputDroppedMessage{
                                                  sessionId, bytesDropped})
                              .dump());
        }
      },
      [weakConnection, sharedContext, sessionId]() {
        auto conn = weakConnection.lock();
        if (conn) {
          json details = {{"exit_code", sharedContext->exitCodeFor(sessionId)}};
          conn->writeLine(daemonMessageToJson(
                              SessionEventMessage{"stopped", sessionId, details})
                              .dump());
        }
      });
  streams[sessionId] = forwarder;
  forwarder->start();
}

void ClientConnectionHandler::stopStream(const string& sessionId) {
  auto it = streams.find(sessionId);
  if (it == streams.end()) {
    return;
  }
  it->second->stop();
  streams.erase(it);
}

void ClientConnectionHandler::teardown() {
  for (auto& it : streams) {
    it.second->stop();
  }
  streams.clear();
  auto lock = context->writeLock();
  context->getSessionManager().detachClientFromAll(clientId);
}

void ClientConnectionHandler::send(const DaemonMessage& message) {
  connection->writeLine(daemonMessageToJson(message).dump());
}
}  // namespace ptykeep
