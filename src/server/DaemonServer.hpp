#ifndef __PTYKEEP_DAEMON_SERVER__
#define __PTYKEEP_DAEMON_SERVER__

#include "DaemonContext.hpp"
#include "Headers.hpp"
#include "LineConnection.hpp"
#include "SocketHandler.hpp"

namespace ptykeep {
/**
 * @brief Accepts connections on the daemon socket and hands each one to a
 * thread running the protocol its first line selects.
 *
 * The accept loop also applies PTY exits reported by output readers. It runs
 * until the context is asked to shut down (daemon_stop, SIGINT or SIGTERM),
 * then stops every running session and removes the socket and PID files.
 */
class DaemonServer {
 public:
  DaemonServer(shared_ptr<DaemonContext> _context,
               shared_ptr<SocketHandler> _socketHandler);
  virtual ~DaemonServer();

  /**
   * @brief Claims the PID file and starts listening on the configured socket.
   * @throws DaemonError AlreadyRunning if another daemon owns the PID file,
   * Io if the socket cannot be bound.
   */
  void listen();

  /** @brief Serves until shutdown, then cleans up. */
  void run();

  void shutdown() { context->requestShutdown(); }

  /** @brief Routes SIGINT and SIGTERM to a graceful shutdown. */
  static void installSignalHandlers();

  /**
   * @brief True when `firstLine` opens a pane-backend connection rather than
   * a primary-protocol one.
   */
  static bool isPaneBackendLine(const string& firstLine);

  shared_ptr<DaemonContext> getContext() { return context; }

 protected:
  struct ConnectionThread {
    shared_ptr<std::thread> thread;
    shared_ptr<atomic<bool>> finished;
  };

  void acceptNewConnection(int listenFd);
  void handleConnection(int clientFd);
  void reapConnectionThreads(bool wait);
  void cleanup();

  shared_ptr<DaemonContext> context;
  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  bool listening;
  bool ownsPidFile;
  mutex connectionThreadMutex;
  vector<ConnectionThread> connectionThreads;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_DAEMON_SERVER__
