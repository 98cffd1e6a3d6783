#ifndef __PTYKEEP_SESSION_INFO__
#define __PTYKEEP_SESSION_INFO__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace ptykeep {
typedef uint64_t ClientId;

enum class SessionState {
  Creating,
  Running,
  Stopped,
};

string sessionStateToString(SessionState state);

/**
 * @brief Snapshot of a session as reported by list/get and session_created.
 *
 * Optional members are omitted from the JSON form when unset.
 */
struct SessionInfo {
  string id;
  string workingDirectory;
  string command;
  string status;
  // RFC 3339, UTC
  string createdAt;
  optional<uint64_t> clientCount;
  optional<int64_t> ptyPid;
  optional<int> exitCode;
  optional<string> projectId;
  optional<string> agent;
  optional<string> note;
};

void to_json(json& j, const SessionInfo& info);
void from_json(const json& j, SessionInfo& info);
}  // namespace ptykeep

#endif  // __PTYKEEP_SESSION_INFO__
