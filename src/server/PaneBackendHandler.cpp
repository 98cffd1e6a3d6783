#include "PaneBackendHandler.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
namespace {
// Child contexts get a fixed terminal size; the leader resizes them if needed
const uint16_t CONTEXT_ROWS = 24;
const uint16_t CONTEXT_COLS = 220;
const char* DEFAULT_CONTEXT_CWD = "/tmp";
}  // namespace

PaneBackendHandler::PaneBackendHandler(shared_ptr<DaemonContext> _context,
                                       shared_ptr<LineConnection> _connection)
    : context(_context), connection(_connection) {}

PaneBackendHandler::~PaneBackendHandler() {
  pendingRelays.clear();
  relays.clear();
}

void PaneBackendHandler::run(const string& firstLine) {
  if (!handshake(firstLine)) {
    return;
  }
  try {
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
    VLOG(1) << "Pane backend connection failed: " << re.what();
  }
  for (auto& relay : relays) {
    relay->stop();
  }
  relays.clear();
  pendingRelays.clear();
  LOG(INFO) << "Pane backend for leader '" << leaderId << "' disconnected";
}

bool PaneBackendHandler::handshake(const string& line) {
  PaneRequest request;
  InitializeParams params;
  try {
    request = parsePaneRequest(line);
    if (request.method != "initialize") {
      LOG(WARNING) << "Expected initialize as first pane backend message, got "
                   << request.method;
      return false;
    }
    params = std::get<InitializeParams>(parsePaneMethod(request));
  } catch (const PaneRpcError& e) {
    LOG(WARNING) << "Invalid pane backend initialize request: " << e.what();
    return false;
  }
  if (params.protocolVersion != PANE_BACKEND_PROTOCOL_VERSION) {
    LOG(WARNING) << "Unsupported pane backend protocol version: "
                 << params.protocolVersion;
    return false;
  }

  if (params.sessionHint) {
    leaderId = *params.sessionHint;
    contextMap.registerLeader(leaderId);
  }

  json result = {{"protocol_version", PANE_BACKEND_PROTOCOL_VERSION},
                 {"capabilities", json::array({"events", "capture"})},
                 {"self_context_id", ContextMap::contextIdForIndex(0)}};
  try {
    connection->writeLine(
        paneResponseToJson(PaneResponse::success(request.id, result)).dump());
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not answer pane backend initialize: " << re.what();
    return false;
  }
  LOG(INFO) << "Pane backend connected, leader '" << leaderId << "'";
  return true;
}

void PaneBackendHandler::handleLine(const string& line) {
  reapRelays();
  if (line.find_first_not_of(" \t\r") == string::npos) {
    return;
  }
  PaneRequest request;
  try {
    request = parsePaneRequest(line);
  } catch (const PaneRpcError& e) {
    LOG(WARNING) << "Ignoring malformed pane backend request: " << e.what();
    return;
  }
  VLOG(2) << "Pane backend request " << request.method << " ("
          << request.id.dump() << ")";

  PaneResponse response = dispatch(request);
  connection->writeLine(paneResponseToJson(response).dump());

  for (auto& relay : pendingRelays) {
    relay->start();
    relays.push_back(relay);
  }
  pendingRelays.clear();
}

void PaneBackendHandler::reapRelays() {
  auto it = relays.begin();
  while (it != relays.end()) {
    if ((*it)->isFinished()) {
      (*it)->stop();
      it = relays.erase(it);
    } else {
      ++it;
    }
  }
}

PaneResponse PaneBackendHandler::dispatch(const PaneRequest& request) {
  try {
    PaneMethod method = parsePaneMethod(request);
    json result;
    if (auto spawnParams = get_if<SpawnAgentParams>(&method)) {
      result = spawnAgent(*spawnParams);
    } else if (auto writeParams = get_if<WriteParams>(&method)) {
      result = write(*writeParams);
    } else if (auto captureParams = get_if<CaptureParams>(&method)) {
      result = capture(*captureParams);
    } else if (auto killParams = get_if<KillParams>(&method)) {
      result = kill(*killParams);
    } else if (holds_alternative<ListParams>(method)) {
      result = list();
    } else {
      // initialize is only valid as the first message
      throw PaneRpcError(PANE_ERROR_METHOD_NOT_FOUND,
                         "method not found: " + request.method);
    }
    return PaneResponse::success(request.id, result);
  } catch (const PaneRpcError& e) {
    if (e.getCode() == PANE_ERROR_METHOD_NOT_FOUND) {
      LOG(WARNING) << e.what();
    } else {
      VLOG(1) << request.method << " failed: " << e.what();
    }
    return PaneResponse::failure(request.id, e.getCode(), e.what());
  }
}

json PaneBackendHandler::spawnAgent(const SpawnAgentParams& params) {
  if (params.command.empty()) {
    throw PaneRpcError(PANE_ERROR_INVALID_PARAMS,
                       "spawn_agent: command must be non-empty");
  }

  CreateSessionRequest request;
  request.workingDirectory = params.cwd.value_or(DEFAULT_CONTEXT_CWD);
  request.command = params.command[0];
  request.args.assign(params.command.begin() + 1, params.command.end());
  request.env = params.env;
  request.rows = CONTEXT_ROWS;
  request.cols = CONTEXT_COLS;
  if (!leaderId.empty()) {
    request.projectId = leaderId;
  }

  optional<BroadcastReceiver> receiver;
  {
    auto lock = context->writeLock();
    auto& sessionManager = context->getSessionManager();
    // Other connections derive ids in the same namespace
    while (sessionManager.getSession(
        childSessionIdFor(contextMap.peekNextIndex()))) {
      contextMap.skipIndex();
    }
    request.sessionId = childSessionIdFor(contextMap.peekNextIndex());
    try {
      sessionManager.createSession(request);
    } catch (const DaemonError& de) {
      if (de.getCode() == DaemonErrorCode::SessionAlreadyExists) {
        contextMap.skipIndex();
      }
      throw PaneRpcError(PANE_ERROR_INTERNAL, de.what());
    }
    // Exits are applied under this lock, so the session is still running
    receiver = sessionManager.subscribeOutput(request.sessionId);
  }
  if (!receiver) {
    throw PaneRpcError(PANE_ERROR_INTERNAL,
                       "no output channel for " + request.sessionId);
  }

  string contextId = contextMap.allocate(request.sessionId);
  startRelay(contextId, request.sessionId, std::move(*receiver));
  LOG(INFO) << "Spawned " << contextId << " as session " << request.sessionId;
  return {{"context_id", contextId}};
}

json PaneBackendHandler::write(const WriteParams& params) {
  string sessionId = resolveContext(params.contextId);
  try {
    auto lock = context->writeLock();
    context->getSessionManager().writeStdin(sessionId, params.data);
  } catch (const DaemonError& de) {
    throw PaneRpcError(PANE_ERROR_INTERNAL, de.what());
  }
  return json::object();
}

json PaneBackendHandler::capture(const CaptureParams& params) {
  string sessionId = resolveContext(params.contextId);
  string data;
  try {
    auto lock = context->readLock();
    data = context->getSessionManager().scrollbackContents(sessionId);
  } catch (const DaemonError& de) {
    // A destroyed session has no scrollback left
    VLOG(1) << "capture of " << params.contextId << ": " << de.what();
  }
  if (params.lines) {
    data = tailLines(data, *params.lines);
  }
  return {{"data", base64Encode(data)}};
}

json PaneBackendHandler::kill(const KillParams& params) {
  string sessionId = resolveContext(params.contextId);
  try {
    auto lock = context->writeLock();
    context->getSessionManager().stopSession(sessionId);
  } catch (const DaemonError& de) {
    if (de.getCode() != DaemonErrorCode::SessionNotFound) {
      // Still mapped so the leader can retry
      throw PaneRpcError(PANE_ERROR_INTERNAL, de.what());
    }
    // Already gone, which is what the caller wants
    VLOG(1) << "kill of " << params.contextId << ": " << de.what();
  }
  contextMap.removeCtx(params.contextId);
  LOG(INFO) << "Killed " << params.contextId << " (" << sessionId << ")";
  return json::object();
}

json PaneBackendHandler::list() {
  return {{"contexts", contextMap.allCtxIds()}};
}

string PaneBackendHandler::resolveContext(const string& contextId) const {
  auto sessionId = contextMap.sessionFor(contextId);
  if (!sessionId) {
    throw PaneRpcError(PANE_ERROR_INVALID_PARAMS,
                       "unknown context_id: " + contextId);
  }
  return *sessionId;
}

void PaneBackendHandler::startRelay(const string& contextId,
                                    const string& sessionId,
                                    BroadcastReceiver receiver) {
  auto weakConnection = weak_ptr<LineConnection>(connection);
  auto sharedContext = context;
  auto relay = make_shared<OutputForwarder>(
      sessionId, std::move(receiver),
      [weakConnection, contextId](const string& data) {
        auto conn = weakConnection.lock();
        if (conn) {
          conn->writeLine(
              paneEventToJson(ContextOutputEvent{contextId, data}).dump());
        }
      },
      [contextId](uint64_t bytesDropped) {
        LOG(WARNING) << "Relay of " << contextId << " dropped " << bytesDropped
                     << " bytes";
      },
      [weakConnection, sharedContext, contextId, sessionId]() {
        auto conn = weakConnection.lock();
        if (conn) {
          conn->writeLine(
              paneEventToJson(
                  ContextExitedEvent{contextId,
                                     sharedContext->exitCodeFor(sessionId)})
                  .dump());
        }
      });
  pendingRelays.push_back(relay);
}

string PaneBackendHandler::childSessionIdFor(uint64_t index) const {
  return leaderId + "_" + ContextMap::contextIdForIndex(index);
}

string PaneBackendHandler::tailLines(const string& text, uint64_t lines) {
  vector<string> all;
  size_t start = 0;
  while (start < text.length()) {
    size_t newline = text.find('\n', start);
    size_t end = (newline == string::npos) ? text.length() : newline;
    string line = text.substr(start, end - start);
    if (newline != string::npos && !line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    all.push_back(line);
    if (newline == string::npos) {
      break;
    }
    start = newline + 1;
  }

  size_t first = all.size() > lines ? all.size() - lines : 0;
  string result;
  for (size_t i = first; i < all.size(); i++) {
    if (i > first) {
      result += "\n";
    }
    result += all[i];
  }
  return result;
}
}  // namespace ptykeep
