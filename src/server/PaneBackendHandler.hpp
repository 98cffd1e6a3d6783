#ifndef __PTYKEEP_PANE_BACKEND_HANDLER__
#define __PTYKEEP_PANE_BACKEND_HANDLER__

#include "ContextMap.hpp"
#include "DaemonContext.hpp"
#include "Headers.hpp"
#include "LineConnection.hpp"
#include "OutputForwarder.hpp"
#include "PaneBackendMessages.hpp"

namespace ptykeep {
/**
 * @brief Serves one pane-backend connection: a leader that spawns and drives
 * child sessions ("contexts") over a single socket.
 *
 * The first line must be an `initialize` request with a supported protocol
 * version. Anything else closes the connection without a response.
 */
class PaneBackendHandler {
 public:
  PaneBackendHandler(shared_ptr<DaemonContext> _context,
                     shared_ptr<LineConnection> _connection);
  virtual ~PaneBackendHandler();

  void run(const string& firstLine);

  /**
   * @brief Keeps the last `lines` lines of `text`, joined with "\n". A
   * trailing newline does not start an extra line, and a "\r" before a
   * newline is dropped.
   */
  static string tailLines(const string& text, uint64_t lines);

 protected:
  /** @return false if the connection must be dropped. */
  bool handshake(const string& line);

  void handleLine(const string& line);
  /** @brief Joins and drops relays whose context has exited. */
  void reapRelays();
  PaneResponse dispatch(const PaneRequest& request);

  json spawnAgent(const SpawnAgentParams& params);
  json write(const WriteParams& params);
  json capture(const CaptureParams& params);
  json kill(const KillParams& params);
  json list();

  string resolveContext(const string& contextId) const;
  void startRelay(const string& contextId, const string& sessionId,
                  BroadcastReceiver receiver);
  string childSessionIdFor(uint64_t index) const;

  shared_ptr<DaemonContext> context;
  shared_ptr<LineConnection> connection;
  string leaderId;
  ContextMap contextMap;
  vector<shared_ptr<OutputForwarder>> relays;
  // Started once the response of the current request is written
  vector<shared_ptr<OutputForwarder>> pendingRelays;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_PANE_BACKEND_HANDLER__
