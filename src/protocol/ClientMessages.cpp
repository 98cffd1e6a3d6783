#include "ClientMessages.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
namespace {
json parseObject(const string& line) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::exception& e) {
    throw DaemonError::protocolError(string("invalid json: ") + e.what());
  }
  if (!j.is_object()) {
    throw DaemonError::protocolError("message is not a json object");
  }
  return j;
}

string requireString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    throw DaemonError::protocolError(string("missing or invalid field: ") +
                                     key);
  }
  return it->get<string>();
}

optional<string> optionalString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullopt;
  }
  if (!it->is_string()) {
    throw DaemonError::protocolError(string("invalid field: ") + key);
  }
  return it->get<string>();
}

bool optionalBool(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return false;
  }
  if (!it->is_boolean()) {
    throw DaemonError::protocolError(string("invalid field: ") + key);
  }
  return it->get<bool>();
}

optional<uint16_t> optionalDimension(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullopt;
  }
  if (!it->is_number_unsigned() ||
      it->get<uint64_t>() > numeric_limits<uint16_t>::max()) {
    throw DaemonError::protocolError(string("invalid field: ") + key);
  }
  return static_cast<uint16_t>(it->get<uint64_t>());
}

uint16_t requireDimension(const json& j, const char* key) {
  auto value = optionalDimension(j, key);
  if (!value) {
    throw DaemonError::protocolError(string("missing or invalid field: ") +
                                     key);
  }
  return *value;
}

string requireBase64(const json& j, const char* key) {
  string encoded = requireString(j, key);
  string decoded;
  if (!base64Decode(encoded, &decoded)) {
    throw DaemonError::protocolError(string("invalid base64 in field: ") +
                                     key);
  }
  return decoded;
}

vector<string> optionalStringArray(const json& j, const char* key) {
  vector<string> values;
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return values;
  }
  if (!it->is_array()) {
    throw DaemonError::protocolError(string("invalid field: ") + key);
  }
  for (const auto& element : *it) {
    if (!element.is_string()) {
      throw DaemonError::protocolError(string("invalid field: ") + key);
    }
    values.push_back(element.get<string>());
  }
  return values;
}

map<string, string> optionalStringMap(const json& j, const char* key) {
  map<string, string> values;
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return values;
  }
  if (!it->is_object()) {
    throw DaemonError::protocolError(string("invalid field: ") + key);
  }
  for (auto element = it->begin(); element != it->end(); ++element) {
    if (!element.value().is_string()) {
      throw DaemonError::protocolError(string("invalid field: ") + key + "." +
                                       element.key());
    }
    values[element.key()] = element.value().get<string>();
  }
  return values;
}

template <typename T>
void putIfSet(json& j, const char* key, const optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

SessionInfo requireSessionInfo(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_object()) {
    throw DaemonError::protocolError(string("missing or invalid field: ") +
                                     key);
  }
  try {
    return it->get<SessionInfo>();
  } catch (const json::exception& e) {
    throw DaemonError::protocolError(string("invalid session info: ") +
                                     e.what());
  }
}
}  // namespace

ClientMessage parseClientMessage(const string& line) {
  json j = parseObject(line);
  string type = requireString(j, "type");
  string id = requireString(j, "id");

  if (type == "create_session") {
    CreateSessionMessage m;
    m.id = id;
    m.sessionId = requireString(j, "session_id");
    m.workingDirectory = requireString(j, "working_directory");
    m.command = requireString(j, "command");
    m.args = optionalStringArray(j, "args");
    m.envVars = optionalStringMap(j, "env_vars");
    m.rows = optionalDimension(j, "rows");
    m.cols = optionalDimension(j, "cols");
    m.useLoginShell = optionalBool(j, "use_login_shell");
    m.projectId = optionalString(j, "project_id");
    m.agent = optionalString(j, "agent");
    m.note = optionalString(j, "note");
    return m;
  }
  if (type == "attach") {
    AttachMessage m;
    m.id = id;
    m.sessionId = requireString(j, "session_id");
    m.rows = requireDimension(j, "rows");
    m.cols = requireDimension(j, "cols");
    return m;
  }
  if (type == "detach") {
    return DetachMessage{id, requireString(j, "session_id")};
  }
  if (type == "resize_pty") {
    ResizePtyMessage m;
    m.id = id;
    m.sessionId = requireString(j, "session_id");
    m.rows = requireDimension(j, "rows");
    m.cols = requireDimension(j, "cols");
    return m;
  }
  if (type == "write_stdin") {
    WriteStdinMessage m;
    m.id = id;
    m.sessionId = requireString(j, "session_id");
    m.data = requireBase64(j, "data");
    return m;
  }
  if (type == "stop_session") {
    return StopSessionMessage{id, requireString(j, "session_id")};
  }
  if (type == "destroy_session") {
    DestroySessionMessage m;
    m.id = id;
    m.sessionId = requireString(j, "session_id");
    m.force = optionalBool(j, "force");
    return m;
  }
  if (type == "list_sessions") {
    return ListSessionsMessage{id, optionalString(j, "project_id")};
  }
  if (type == "get_session") {
    return GetSessionMessage{id, requireString(j, "session_id")};
  }
  if (type == "read_scrollback") {
    return ReadScrollbackMessage{id, requireString(j, "session_id")};
  }
  if (type == "daemon_stop") {
    return DaemonStopMessage{id};
  }
  if (type == "ping") {
    return PingMessage{id};
  }
  throw DaemonError::protocolError("unknown message type: " + type);
}

optional<string> recoverRequestId(const string& line) {
  json j = json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return nullopt;
  }
  auto it = j.find("id");
  if (it == j.end() || !it->is_string()) {
    return nullopt;
  }
  return it->get<string>();
}

string requestIdOf(const ClientMessage& message) {
  return std::visit([](const auto& m) { return m.id; }, message);
}

string messageTypeOf(const ClientMessage& message) {
  return std::visit(
      [](const auto& m) -> string {
        typedef std::decay_t<decltype(m)> T;
        if constexpr (std::is_same_v<T, CreateSessionMessage>) {
          return "create_session";
        } else if constexpr (std::is_same_v<T, AttachMessage>) {
          return "attach";
        } else if constexpr (std::is_same_v<T, DetachMessage>) {
          return "detach";
        } else if constexpr (std::is_same_v<T, ResizePtyMessage>) {
          return "resize_pty";
        } else if constexpr (std::is_same_v<T, WriteStdinMessage>) {
          return "write_stdin";
        } else if constexpr (std::is_same_v<T, StopSessionMessage>) {
          return "stop_session";
        } else if constexpr (std::is_same_v<T, DestroySessionMessage>) {
          return "destroy_session";
        } else if constexpr (std::is_same_v<T, ListSessionsMessage>) {
          return "list_sessions";
        } else if constexpr (std::is_same_v<T, GetSessionMessage>) {
          return "get_session";
        } else if constexpr (std::is_same_v<T, ReadScrollbackMessage>) {
          return "read_scrollback";
        } else if constexpr (std::is_same_v<T, DaemonStopMessage>) {
          return "daemon_stop";
        } else {
          return "ping";
        }
      },
      message);
}

json clientMessageToJson(const ClientMessage& message) {
  json j = {{"type", messageTypeOf(message)}, {"id", requestIdOf(message)}};
  std::visit(
      [&j](const auto& m) {
        typedef std::decay_t<decltype(m)> T;
        if constexpr (std::is_same_v<T, CreateSessionMessage>) {
          j["session_id"] = m.sessionId;
          j["working_directory"] = m.workingDirectory;
          j["command"] = m.command;
          if (!m.args.empty()) {
            j["args"] = m.args;
          }
          if (!m.envVars.empty()) {
            j["env_vars"] = m.envVars;
          }
          putIfSet(j, "rows", m.rows);
          putIfSet(j, "cols", m.cols);
          if (m.useLoginShell) {
            j["use_login_shell"] = true;
          }
          putIfSet(j, "project_id", m.projectId);
          putIfSet(j, "agent", m.agent);
          putIfSet(j, "note", m.note);
        } else if constexpr (std::is_same_v<T, AttachMessage> ||
                             std::is_same_v<T, ResizePtyMessage>) {
          j["session_id"] = m.sessionId;
          j["rows"] = m.rows;
          j["cols"] = m.cols;
        } else if constexpr (std::is_same_v<T, WriteStdinMessage>) {
          j["session_id"] = m.sessionId;
          j["data"] = base64Encode(m.data);
        } else if constexpr (std::is_same_v<T, DestroySessionMessage>) {
          j["session_id"] = m.sessionId;
          if (m.force) {
            j["force"] = true;
          }
        } else if constexpr (std::is_same_v<T, ListSessionsMessage>) {
          putIfSet(j, "project_id", m.projectId);
        } else if constexpr (std::is_same_v<T, DetachMessage> ||
                             std::is_same_v<T, StopSessionMessage> ||
                             std::is_same_v<T, GetSessionMessage> ||
                             std::is_same_v<T, ReadScrollbackMessage>) {
          j["session_id"] = m.sessionId;
        }
      },
      message);
  return j;
}

json daemonMessageToJson(const DaemonMessage& message) {
  return std::visit(
      [](const auto& m) -> json {
        typedef std::decay_t<decltype(m)> T;
        if constexpr (std::is_same_v<T, SessionCreatedMessage>) {
          return {{"type", "session_created"},
                  {"id", m.id},
                  {"session", m.session}};
        } else if constexpr (std::is_same_v<T, PtyOutputMessage>) {
          return {{"type", "pty_output"},
                  {"session_id", m.sessionId},
                  {"data", base64Encode(m.data)}};
        } else if constexpr (std::is_same_v<T, PtyOutputDroppedMessage>) {
          return {{"type", "pty_output_dropped"},
                  {"session_id", m.sessionId},
                  {"bytes_dropped", m.bytesDropped}};
        } else if constexpr (std::is_same_v<T, SessionEventMessage>) {
          json j = {{"type", "session_event"},
                    {"event", m.event},
                    {"session_id", m.sessionId}};
          putIfSet(j, "details", m.details);
          return j;
        } else if constexpr (std::is_same_v<T, SessionListMessage>) {
          return {{"type", "session_list"},
                  {"id", m.id},
                  {"sessions", m.sessions}};
        } else if constexpr (std::is_same_v<T, SessionInfoMessage>) {
          return {{"type", "session_info"},
                  {"id", m.id},
                  {"session", m.session}};
        } else if constexpr (std::is_same_v<T, ScrollbackContentsMessage>) {
          return {{"type", "scrollback_contents"},
                  {"id", m.id},
                  {"data", base64Encode(m.data)}};
        } else if constexpr (std::is_same_v<T, ErrorMessage>) {
          return {{"type", "error"},
                  {"id", m.id},
                  {"code", m.code},
                  {"message", m.message}};
        } else {
          return {{"type", "ack"}, {"id", m.id}};
        }
      },
      message);
}

DaemonMessage parseDaemonMessage(const string& line) {
  json j = parseObject(line);
  string type = requireString(j, "type");

  if (type == "session_created") {
    return SessionCreatedMessage{requireString(j, "id"),
                                 requireSessionInfo(j, "session")};
  }
  if (type == "pty_output") {
    return PtyOutputMessage{requireString(j, "session_id"),
                            requireBase64(j, "data")};
  }
  if (type == "pty_output_dropped") {
    auto it = j.find("bytes_dropped");
    if (it == j.end() || !it->is_number_unsigned()) {
      throw DaemonError::protocolError(
          "missing or invalid field: bytes_dropped");
    }
    return PtyOutputDroppedMessage{requireString(j, "session_id"),
                                   it->get<uint64_t>()};
  }
  if (type == "session_event") {
    SessionEventMessage m;
    m.event = requireString(j, "event");
    m.sessionId = requireString(j, "session_id");
    auto it = j.find("details");
    if (it != j.end() && !it->is_null()) {
      m.details = *it;
    }
    return m;
  }
  if (type == "session_list") {
    SessionListMessage m;
    m.id = requireString(j, "id");
    auto it = j.find("sessions");
    if (it == j.end() || !it->is_array()) {
      throw DaemonError::protocolError("missing or invalid field: sessions");
    }
    try {
      m.sessions = it->get<vector<SessionInfo>>();
    } catch (const json::exception& e) {
      throw DaemonError::protocolError(string("invalid session info: ") +
                                       e.what());
    }
    return m;
  }
  if (type == "session_info") {
    return SessionInfoMessage{requireString(j, "id"),
                              requireSessionInfo(j, "session")};
  }
  if (type == "scrollback_contents") {
    return ScrollbackContentsMessage{requireString(j, "id"),
                                     requireBase64(j, "data")};
  }
  if (type == "error") {
    return ErrorMessage{requireString(j, "id"), requireString(j, "code"),
                        requireString(j, "message")};
  }
  if (type == "ack") {
    return AckMessage{requireString(j, "id")};
  }
  throw DaemonError::protocolError("unknown message type: " + type);
}
}  // namespace ptykeep
