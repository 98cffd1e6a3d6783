#ifndef __PTYKEEP_UNIX_SOCKET_HANDLER__
#define __PTYKEEP_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace ptykeep {
/**
 * @brief fd-level operations shared by the socket handlers. Each tracked
 * fd has its own mutex so a close never races a read or write.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler();

  virtual bool waitForData(int fd, int64_t usec);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  /** @brief Shuts the socket down, closes it and stops tracking it. */
  virtual void close(int fd);

 protected:
  void addToActiveSockets(int fd);
  /** @return The fd's mutex, or null once it has been closed. */
  shared_ptr<recursive_mutex> socketMutex(int fd);
  virtual void initSocket(int fd);

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_UNIX_SOCKET_HANDLER__
