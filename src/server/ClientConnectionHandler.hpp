#ifndef __PTYKEEP_CLIENT_CONNECTION_HANDLER__
#define __PTYKEEP_CLIENT_CONNECTION_HANDLER__

#include "ClientMessages.hpp"
#include "DaemonContext.hpp"
#include "Headers.hpp"
#include "LineConnection.hpp"
#include "OutputForwarder.hpp"

namespace ptykeep {
/**
 * @brief Serves one primary-protocol connection.
 *
 * Requests are handled one at a time in arrival order. Each attach starts an
 * OutputForwarder that pushes the session's output on the same connection.
 */
class ClientConnectionHandler {
 public:
  ClientConnectionHandler(shared_ptr<DaemonContext> _context,
                          shared_ptr<LineConnection> _connection);
  virtual ~ClientConnectionHandler();

  /**
   * @brief Handles `firstLine`, then serves the connection until the peer
   * hangs up or the daemon shuts down.
   */
  void run(const string& firstLine);

  ClientId getClientId() const { return clientId; }

 protected:
  void handleLine(const string& line);
  void handleMessage(const ClientMessage& message);

  SessionCreatedMessage createSession(const CreateSessionMessage& m);
  void attach(const AttachMessage& m);

  void startStream(const string& sessionId, BroadcastReceiver receiver);
  void stopStream(const string& sessionId);
  void teardown();

  void send(const DaemonMessage& message);

  shared_ptr<DaemonContext> context;
  shared_ptr<LineConnection> connection;
  ClientId clientId;
  map<string, shared_ptr<OutputForwarder>> streams;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_CLIENT_CONNECTION_HANDLER__
