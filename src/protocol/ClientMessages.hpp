#ifndef __PTYKEEP_CLIENT_MESSAGES__
#define __PTYKEEP_CLIENT_MESSAGES__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionInfo.hpp"

namespace ptykeep {
// Client -> daemon. Every request carries a caller-chosen `id` that the
// response echoes. Byte payloads are held decoded; the codec converts them
// to and from base64.

struct CreateSessionMessage {
  string id;
  string sessionId;
  string workingDirectory;
  string command;
  vector<string> args;
  map<string, string> envVars;
  optional<uint16_t> rows;
  optional<uint16_t> cols;
  bool useLoginShell = false;
  optional<string> projectId;
  optional<string> agent;
  optional<string> note;
};

struct AttachMessage {
  string id;
  string sessionId;
  uint16_t rows = 0;
  uint16_t cols = 0;
};

struct DetachMessage {
  string id;
  string sessionId;
};

struct ResizePtyMessage {
  string id;
  string sessionId;
  uint16_t rows = 0;
  uint16_t cols = 0;
};

struct WriteStdinMessage {
  string id;
  string sessionId;
  string data;
};

struct StopSessionMessage {
  string id;
  string sessionId;
};

struct DestroySessionMessage {
  string id;
  string sessionId;
  bool force = false;
};

struct ListSessionsMessage {
  string id;
  optional<string> projectId;
};

struct GetSessionMessage {
  string id;
  string sessionId;
};

struct ReadScrollbackMessage {
  string id;
  string sessionId;
};

struct DaemonStopMessage {
  string id;
};

struct PingMessage {
  string id;
};

typedef variant<CreateSessionMessage, AttachMessage, DetachMessage,
                ResizePtyMessage, WriteStdinMessage, StopSessionMessage,
                DestroySessionMessage, ListSessionsMessage, GetSessionMessage,
                ReadScrollbackMessage, DaemonStopMessage, PingMessage>
    ClientMessage;

// Daemon -> client. Responses echo the request id; pty_output,
// pty_output_dropped and session_event are pushed without one.

struct SessionCreatedMessage {
  string id;
  SessionInfo session;
};

struct PtyOutputMessage {
  string sessionId;
  string data;
};

struct PtyOutputDroppedMessage {
  string sessionId;
  uint64_t bytesDropped = 0;
};

struct SessionEventMessage {
  string event;
  string sessionId;
  optional<json> details;
};

struct SessionListMessage {
  string id;
  vector<SessionInfo> sessions;
};

struct SessionInfoMessage {
  string id;
  SessionInfo session;
};

struct ScrollbackContentsMessage {
  string id;
  string data;
};

struct ErrorMessage {
  string id;
  string code;
  string message;
};

struct AckMessage {
  string id;
};

typedef variant<SessionCreatedMessage, PtyOutputMessage,
                PtyOutputDroppedMessage, SessionEventMessage,
                SessionListMessage, SessionInfoMessage,
                ScrollbackContentsMessage, ErrorMessage, AckMessage>
    DaemonMessage;

/**
 * @brief Decodes one request line, dispatching on its `type` member.
 * @throws DaemonError ProtocolError for malformed JSON, an unknown type,
 * missing or mistyped fields, or invalid base64.
 */
ClientMessage parseClientMessage(const string& line);

/**
 * @brief Best-effort extraction of a string `id` from a line that failed to
 * parse, so the error can still be correlated.
 */
optional<string> recoverRequestId(const string& line);

json clientMessageToJson(const ClientMessage& message);

/** @brief The correlation id of any request. */
string requestIdOf(const ClientMessage& message);

/** @brief The wire `type` tag of any request. */
string messageTypeOf(const ClientMessage& message);

json daemonMessageToJson(const DaemonMessage& message);

/** @throws DaemonError ProtocolError */
DaemonMessage parseDaemonMessage(const string& line);
}  // namespace ptykeep

#endif  // __PTYKEEP_CLIENT_MESSAGES__
