#ifndef __PTYKEEP_PIPE_SOCKET_HANDLER__
#define __PTYKEEP_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace ptykeep {
/**
 * @brief Unix domain stream sockets addressed by the filesystem path in the
 * endpoint name.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler();

  /** @return The connected fd, or -1 with errno set. */
  virtual int connect(const SocketEndpoint& endpoint);

  /**
   * @brief Binds the path, replacing a stale socket file left by a daemon
   * that died. The socket file is made accessible to its owner only.
   * @throws DaemonError Io when the path is too long, is occupied by
   * something other than a socket, or cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /** @brief Closes the listening fd and unlinks the socket file. */
  virtual void stopListening(const SocketEndpoint& endpoint);

  /** @brief True when `path` fits in sockaddr_un::sun_path. */
  static bool fitsSocketPath(const string& path);

 protected:
  static sockaddr_un makeAddress(const string& path);

  map<string, int> listenSockets;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_PIPE_SOCKET_HANDLER__
