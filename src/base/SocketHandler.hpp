#ifndef __PTYKEEP_SOCKET_HANDLER__
#define __PTYKEEP_SOCKET_HANDLER__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief The daemon's view of its client sockets: one listening endpoint and
 * the stream connections accepted from it.
 *
 * Every fd handed out is non-blocking and close-on-exec, so a PTY child
 * never inherits a client connection.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /** @brief Waits up to `usec` microseconds for `fd` to become readable. */
  virtual bool waitForData(int fd, int64_t usec) = 0;

  /**
   * @brief Reads whatever is available, at most `count` bytes.
   * @return Bytes read, 0 on orderly close, -1 with errno set otherwise
   * (EAGAIN when nothing was ready).
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;

  /**
   * @brief A single non-blocking send.
   * @return Bytes accepted by the kernel, or -1 with errno set.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Writes every byte, waiting while the peer's buffer is full.
   * @throws std::runtime_error if the peer is gone or makes no progress for
   * `stallTimeoutSecs`.
   */
  void writeAll(int fd, const void* buf, size_t count, int stallTimeoutSecs);

  /** @return A connected fd, or -1 with errno set. */
  virtual int connect(const SocketEndpoint& endpoint) = 0;

  /** @return The listening fds for the endpoint. */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;

  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;

  /** @return The accepted fd, or -1 when nothing was pending. */
  virtual int accept(int fd) = 0;

  virtual void stopListening(const SocketEndpoint& endpoint) = 0;

  virtual void close(int fd) = 0;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_SOCKET_HANDLER__
