#include "SocketHandler.hpp"

namespace ptykeep {
void SocketHandler::writeAll(int fd, const void* buf, size_t count,
                             int stallTimeoutSecs) {
  const char* data = static_cast<const char*>(buf);
  auto lastProgress = std::chrono::steady_clock::now();
  size_t pos = 0;
  while (pos < count) {
    ssize_t bytesWritten = write(fd, data + pos, count - pos);
    if (bytesWritten > 0) {
      pos += bytesWritten;
      lastProgress = std::chrono::steady_clock::now();
      continue;
    }
    auto localErrno = GetErrno();
    if (bytesWritten == 0 ||
        (localErrno != EAGAIN && localErrno != EWOULDBLOCK &&
         localErrno != EINTR)) {
      VLOG(1) << "Write to " << fd << " failed: " << strerror(localErrno);
      throw std::runtime_error(string("socket write failed: ") +
                               strerror(localErrno));
    }
    if (std::chrono::steady_clock::now() - lastProgress >
        std::chrono::seconds(stallTimeoutSecs)) {
      throw std::runtime_error("socket write timed out");
    }
    // The peer is not reading, wait until it drains some of its buffer
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    ::poll(&pfd, 1, 100);
  }
}
}  // namespace ptykeep
