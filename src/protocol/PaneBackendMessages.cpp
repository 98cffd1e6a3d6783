#include "PaneBackendMessages.hpp"

namespace ptykeep {
namespace {
PaneRpcError invalidParams(const string& detail) {
  return PaneRpcError(PANE_ERROR_INVALID_PARAMS, "invalid params: " + detail);
}

string requireString(const json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || !it->is_string()) {
    throw invalidParams(string("missing or invalid ") + key);
  }
  return it->get<string>();
}

optional<string> optionalString(const json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return nullopt;
  }
  if (!it->is_string()) {
    throw invalidParams(string("invalid ") + key);
  }
  return it->get<string>();
}

vector<string> stringArray(const json& value, const char* key) {
  if (!value.is_array()) {
    throw invalidParams(string("invalid ") + key);
  }
  vector<string> result;
  for (const auto& element : value) {
    if (!element.is_string()) {
      throw invalidParams(string("invalid ") + key);
    }
    result.push_back(element.get<string>());
  }
  return result;
}

json parseObjectLine(const string& line) {
  json j = json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw PaneRpcError(PANE_ERROR_INVALID_PARAMS, "not a json object");
  }
  return j;
}
}  // namespace

PaneRequest parsePaneRequest(const string& line) {
  json j = parseObjectLine(line);
  auto method = j.find("method");
  if (method == j.end() || !method->is_string()) {
    throw PaneRpcError(PANE_ERROR_INVALID_PARAMS, "missing method");
  }
  PaneRequest request;
  request.method = method->get<string>();
  auto id = j.find("id");
  if (id != j.end()) {
    request.id = *id;
  }
  auto params = j.find("params");
  if (params != j.end() && !params->is_null()) {
    request.params = *params;
  } else {
    request.params = json::object();
  }
  return request;
}

PaneMethod parsePaneMethod(const PaneRequest& request) {
  const string& method = request.method;
  const json& params = request.params;
  if (method != "initialize" && method != "spawn_agent" &&
      method != "write" && method != "capture" && method != "kill" &&
      method != "list") {
    throw PaneRpcError(PANE_ERROR_METHOD_NOT_FOUND,
                       "method not found: " + method);
  }
  if (!params.is_object()) {
    throw invalidParams("params must be an object");
  }

  if (method == "initialize") {
    InitializeParams p;
    p.protocolVersion = requireString(params, "protocol_version");
    auto capabilities = params.find("capabilities");
    if (capabilities != params.end() && !capabilities->is_null()) {
      p.capabilities = stringArray(*capabilities, "capabilities");
    }
    p.sessionHint = optionalString(params, "session_hint");
    return p;
  }
  if (method == "spawn_agent") {
    SpawnAgentParams p;
    auto command = params.find("command");
    if (command == params.end()) {
      throw invalidParams("missing command");
    }
    p.command = stringArray(*command, "command");
    p.cwd = optionalString(params, "cwd");
    auto env = params.find("env");
    if (env != params.end() && !env->is_null()) {
      if (!env->is_object()) {
        throw invalidParams("invalid env");
      }
      for (auto it = env->begin(); it != env->end(); ++it) {
        if (!it.value().is_string()) {
          throw invalidParams("invalid env value for " + it.key());
        }
        p.env[it.key()] = it.value().get<string>();
      }
    }
    auto metadata = params.find("metadata");
    if (metadata != params.end()) {
      p.metadata = *metadata;
    }
    return p;
  }
  if (method == "write") {
    WriteParams p;
    p.contextId = requireString(params, "context_id");
    string encoded = requireString(params, "data");
    if (!base64Decode(encoded, &p.data)) {
      throw PaneRpcError(PANE_ERROR_INVALID_PARAMS, "base64 decode error");
    }
    return p;
  }
  if (method == "capture") {
    CaptureParams p;
    p.contextId = requireString(params, "context_id");
    auto lines = params.find("lines");
    if (lines != params.end() && !lines->is_null()) {
      if (!lines->is_number_unsigned()) {
        throw invalidParams("invalid lines");
      }
      p.lines = lines->get<uint64_t>();
    }
    return p;
  }
  if (method == "kill") {
    return KillParams{requireString(params, "context_id")};
  }
  return ListParams();
}

json paneRequestToJson(const PaneRequest& request) {
  return {
      {"id", request.id}, {"method", request.method}, {"params", request.params}};
}

json paneResponseToJson(const PaneResponse& response) {
  json j = {{"id", response.id}};
  if (const PaneErrorBody* error = get_if<PaneErrorBody>(&response.body)) {
    j["error"] = {{"code", error->code}, {"message", error->message}};
  } else {
    j["result"] = get<json>(response.body);
  }
  return j;
}

PaneResponse parsePaneResponse(const string& line) {
  json j = parseObjectLine(line);
  json id = j.contains("id") ? j["id"] : json();
  bool hasResult = j.contains("result");
  bool hasError = j.contains("error");
  if (hasResult == hasError) {
    throw PaneRpcError(PANE_ERROR_INVALID_PARAMS,
                       "response needs exactly one of result or error");
  }
  if (hasResult) {
    return PaneResponse::success(id, j["result"]);
  }
  const json& error = j["error"];
  if (!error.is_object() || !error.contains("code") ||
      !error["code"].is_number_integer()) {
    throw PaneRpcError(PANE_ERROR_INVALID_PARAMS, "invalid error body");
  }
  string message;
  if (error.contains("message") && error["message"].is_string()) {
    message = error["message"].get<string>();
  }
  return PaneResponse::failure(id, error["code"].get<int>(), message);
}

json paneEventToJson(const PaneEvent& event) {
  if (const ContextOutputEvent* output = get_if<ContextOutputEvent>(&event)) {
    return {{"method", "context_output"},
            {"params",
             {{"context_id", output->contextId},
              {"data", base64Encode(output->data)}}}};
  }
  const ContextExitedEvent& exited = get<ContextExitedEvent>(event);
  return {{"method", "context_exited"},
          {"params",
           {{"context_id", exited.contextId},
            {"exit_code", exited.exitCode}}}};
}

PaneEvent parsePaneEvent(const string& line) {
  json j = parseObjectLine(line);
  string method = requireString(j, "method");
  auto params = j.find("params");
  if (params == j.end() || !params->is_object()) {
    throw invalidParams("missing params");
  }
  if (method == "context_output") {
    ContextOutputEvent event;
    event.contextId = requireString(*params, "context_id");
    if (!base64Decode(requireString(*params, "data"), &event.data)) {
      throw PaneRpcError(PANE_ERROR_INVALID_PARAMS, "base64 decode error");
    }
    return event;
  }
  if (method == "context_exited") {
    ContextExitedEvent event;
    event.contextId = requireString(*params, "context_id");
    auto code = params->find("exit_code");
    if (code == params->end() || !code->is_number_integer()) {
      throw invalidParams("missing or invalid exit_code");
    }
    event.exitCode = code->get<int>();
    return event;
  }
  throw PaneRpcError(PANE_ERROR_METHOD_NOT_FOUND,
                     "unknown event: " + method);
}
}  // namespace ptykeep
