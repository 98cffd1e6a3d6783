#include "UnixSocketHandler.hpp"

namespace ptykeep {
UnixSocketHandler::UnixSocketHandler() {}

UnixSocketHandler::~UnixSocketHandler() {
  lock_guard<recursive_mutex> guard(globalMutex);
  for (auto& it : activeSocketMutexes) {
    VLOG(1) << "Closing leftover socket " << it.first;
    ::close(it.first);
  }
  activeSocketMutexes.clear();
}

bool UnixSocketHandler::waitForData(int fd, int64_t usec) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int n = ::poll(&pfd, 1, int(usec / 1000));
  if (n == -1) {
    VLOG(4) << "poll on " << fd << " failed: " << strerror(GetErrno());
    return false;
  }
  // A hangup or error is reported as readable so the next read sees it
  return n > 0;
}

shared_ptr<recursive_mutex> UnixSocketHandler::socketMutex(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void* buf, size_t count) {
  auto m = socketMutex(fd);
  if (!m) {
    VLOG(1) << "Read from closed socket " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*m);
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = GetErrno();
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK &&
      localErrno != EINTR) {
    LOG(WARNING) << "Error reading from socket " << fd << ": "
                 << strerror(localErrno);
  }
  SetErrno(localErrno);
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void* buf, size_t count) {
  auto m = socketMutex(fd);
  if (!m) {
    VLOG(1) << "Write to closed socket " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*m);
  return ::send(fd, buf, count, MSG_NOSIGNAL);
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Socket " << fd << " is already tracked";
  }
  activeSocketMutexes[fd] = make_shared<recursive_mutex>();
}

int UnixSocketHandler::accept(int listenFd) {
  int clientFd = ::accept(listenFd, NULL, NULL);
  if (clientFd < 0) {
    auto acceptErrno = GetErrno();
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK &&
        acceptErrno != EINTR && acceptErrno != ECONNABORTED) {
      LOG(WARNING) << "accept on " << listenFd
                   << " failed: " << strerror(acceptErrno);
    }
    SetErrno(acceptErrno);
    return -1;
  }
  initSocket(clientFd);
  addToActiveSockets(clientFd);
  VLOG(3) << "Listener " << listenFd << " accepted socket " << clientFd;
  return clientFd;
}

void UnixSocketHandler::close(int fd) {
  shared_ptr<recursive_mutex> m;
  {
    lock_guard<recursive_mutex> guard(globalMutex);
    auto it = activeSocketMutexes.find(fd);
    if (it == activeSocketMutexes.end()) {
      STERROR << "Tried to close a socket that is not open: " << fd;
      return;
    }
    m = it->second;
    activeSocketMutexes.erase(it);
  }
  lock_guard<recursive_mutex> guard(*m);
  VLOG(1) << "Closing socket " << fd;
  ::shutdown(fd, SHUT_RDWR);
  FATAL_FAIL(::close(fd));
}

void UnixSocketHandler::initSocket(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));

  int fdFlags = fcntl(fd, F_GETFD);
  FATAL_FAIL(fdFlags);
  FATAL_FAIL(fcntl(fd, F_SETFD, fdFlags | FD_CLOEXEC));
}
}  // namespace ptykeep
