#ifndef __PTYKEEP_PANE_BACKEND_MESSAGES__
#define __PTYKEEP_PANE_BACKEND_MESSAGES__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace ptykeep {
// JSON-RPC style error codes
static const int PANE_ERROR_METHOD_NOT_FOUND = -32601;
static const int PANE_ERROR_INVALID_PARAMS = -32602;
static const int PANE_ERROR_INTERNAL = -32603;

/**
 * @brief A request or event that cannot be honored; carries the JSON-RPC
 * error code to answer with.
 */
class PaneRpcError : public std::runtime_error {
 public:
  PaneRpcError(int _code, const string& message)
      : std::runtime_error(message), code(_code) {}

  int getCode() const { return code; }

 protected:
  int code;
};

/** @brief Envelope `{id, method, params}`. The id is echoed verbatim. */
struct PaneRequest {
  json id;
  string method;
  json params;
};

struct InitializeParams {
  string protocolVersion;
  vector<string> capabilities;
  optional<string> sessionHint;
};

struct SpawnAgentParams {
  vector<string> command;
  optional<string> cwd;
  map<string, string> env;
  json metadata;
};

struct WriteParams {
  string contextId;
  // Decoded bytes
  string data;
};

struct CaptureParams {
  string contextId;
  optional<uint64_t> lines;
};

struct KillParams {
  string contextId;
};

struct ListParams {};

typedef variant<InitializeParams, SpawnAgentParams, WriteParams,
                CaptureParams, KillParams, ListParams>
    PaneMethod;

struct PaneErrorBody {
  int code = 0;
  string message;
};

/** @brief Exactly one of result or error, never both. */
struct PaneResponse {
  json id;
  variant<json, PaneErrorBody> body;

  static PaneResponse success(const json& id, const json& result) {
    return PaneResponse{id, result};
  }

  static PaneResponse failure(const json& id, int code,
                              const string& message) {
    return PaneResponse{id, PaneErrorBody{code, message}};
  }

  bool isError() const { return holds_alternative<PaneErrorBody>(body); }
};

struct ContextOutputEvent {
  string contextId;
  // Raw bytes; base64 on the wire
  string data;
};

struct ContextExitedEvent {
  string contextId;
  int exitCode = -1;
};

typedef variant<ContextOutputEvent, ContextExitedEvent> PaneEvent;

/**
 * @brief Parses a request envelope.
 * @throws PaneRpcError with PANE_ERROR_INVALID_PARAMS for a line that is not
 * a JSON object or lacks a string `method`.
 */
PaneRequest parsePaneRequest(const string& line);

/**
 * @brief Decodes `request.params` for its method.
 * @throws PaneRpcError METHOD_NOT_FOUND for unknown methods, INVALID_PARAMS
 * for missing or malformed params.
 */
PaneMethod parsePaneMethod(const PaneRequest& request);

json paneRequestToJson(const PaneRequest& request);

json paneResponseToJson(const PaneResponse& response);

PaneResponse parsePaneResponse(const string& line);

json paneEventToJson(const PaneEvent& event);

PaneEvent parsePaneEvent(const string& line);
}  // namespace ptykeep

#endif  // __PTYKEEP_PANE_BACKEND_MESSAGES__
