#include "SessionInfo.hpp"

namespace ptykeep {
string sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::Creating:
      return "creating";
    case SessionState::Running:
      return "running";
    case SessionState::Stopped:
      return "stopped";
  }
  return "unknown";
}

namespace {
template <typename T>
void putIfSet(json& j, const char* key, const optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename T>
void getIfPresent(const json& j, const char* key, optional<T>* value) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    *value = it->get<T>();
  } else {
    value->reset();
  }
}
}  // namespace

void to_json(json& j, const SessionInfo& info) {
  j = json{{"id", info.id},
           {"working_directory", info.workingDirectory},
           {"command", info.command},
           {"status", info.status},
           {"created_at", info.createdAt}};
  putIfSet(j, "client_count", info.clientCount);
  putIfSet(j, "pty_pid", info.ptyPid);
  putIfSet(j, "exit_code", info.exitCode);
  putIfSet(j, "project_id", info.projectId);
  putIfSet(j, "agent", info.agent);
  putIfSet(j, "note", info.note);
}

void from_json(const json& j, SessionInfo& info) {
  j.at("id").get_to(info.id);
  j.at("working_directory").get_to(info.workingDirectory);
  j.at("command").get_to(info.command);
  j.at("status").get_to(info.status);
  j.at("created_at").get_to(info.createdAt);
  getIfPresent(j, "client_count", &info.clientCount);
  getIfPresent(j, "pty_pid", &info.ptyPid);
  getIfPresent(j, "exit_code", &info.exitCode);
  getIfPresent(j, "project_id", &info.projectId);
  getIfPresent(j, "agent", &info.agent);
  getIfPresent(j, "note", &info.note);
}
}  // namespace ptykeep
