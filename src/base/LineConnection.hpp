#ifndef __PTYKEEP_LINE_CONNECTION__
#define __PTYKEEP_LINE_CONNECTION__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace ptykeep {
/**
 * @brief A socket carrying newline-delimited messages in both directions.
 *
 * One thread reads; any number of threads may write. Each writeLine() is
 * atomic with respect to the others, so lines from request handling and
 * from output forwarders never interleave.
 */
class LineConnection {
 public:
  LineConnection(shared_ptr<SocketHandler> _socketHandler, int _socketFd);
  virtual ~LineConnection();

  /**
   * @brief Reads the next line, without its terminator.
   * @param timeoutUsec How long to wait for more bytes.
   * @return 1 when a line was read, 0 on timeout, and -1 once the peer has
   * closed the socket, an error occurred, or a line exceeded MAX_LINE_LENGTH.
   */
  int readLine(string* line, int64_t timeoutUsec);

  /**
   * @brief Writes `line` followed by a newline.
   * @throws std::runtime_error if the socket is closed or the write times out.
   * After one failure every later write fails fast.
   */
  void writeLine(const string& line);

  /** @brief Shuts the socket down and releases the fd. Idempotent. */
  void close();

  bool isWriteFailed() const { return writeFailed; }

  int getSocketFd() const { return socketFd; }

 protected:
  bool takeBufferedLine(string* line);

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  string partialLine;
  bool peerClosed;
  mutex writeMutex;
  atomic<bool> writeFailed;
  mutex closeMutex;
  bool closed;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_LINE_CONNECTION__
