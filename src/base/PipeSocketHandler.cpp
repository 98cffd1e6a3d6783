#include "PipeSocketHandler.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
PipeSocketHandler::PipeSocketHandler() {}

PipeSocketHandler::~PipeSocketHandler() {
  lock_guard<recursive_mutex> guard(globalMutex);
  for (auto& it : listenSockets) {
    LOG(WARNING) << "Still listening on " << it.first << " at shutdown";
    ::close(it.second);
  }
}

bool PipeSocketHandler::fitsSocketPath(const string& path) {
  sockaddr_un addr;
  return !path.empty() && path.length() < sizeof(addr.sun_path);
}

sockaddr_un PipeSocketHandler::makeAddress(const string& path) {
  sockaddr_un addr;
  memset(&addr, 0, sizeof(sockaddr_un));
  addr.sun_family = AF_UNIX;
  strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  return addr;
}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  const string& path = endpoint.name();
  if (!fitsSocketPath(path)) {
    SetErrno(ENAMETOOLONG);
    return -1;
  }
  sockaddr_un remote = makeAddress(path);

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  // Local connects complete or fail immediately, so connect before going
  // non-blocking
  if (::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un)) ==
      -1) {
    auto localErrno = GetErrno();
    VLOG(1) << "Could not connect to " << path << ": " << strerror(localErrno);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }
  initSocket(sockFd);
  addToActiveSockets(sockFd);
  VLOG(1) << "Connected to " << path << " on fd " << sockFd;
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  const string& path = endpoint.name();
  if (listenSockets.find(path) != listenSockets.end()) {
    throw DaemonError::io("already listening on " + path);
  }
  if (!fitsSocketPath(path)) {
    throw DaemonError::io("invalid socket path: " + path);
  }

  struct stat st;
  if (::lstat(path.c_str(), &st) == 0) {
    if (!S_ISSOCK(st.st_mode)) {
      throw DaemonError::io(path + " exists and is not a socket");
    }
    // Only a daemon that died leaves its socket behind, a live one was
    // caught by the pid file check
    LOG(INFO) << "Removing stale socket " << path;
    if (::unlink(path.c_str()) == -1) {
      throw DaemonError::io("cannot remove stale socket " + path + ": " +
                            strerror(GetErrno()));
    }
  }

  sockaddr_un local = makeAddress(path);
  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initSocket(fd);
  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1 ||
      ::chmod(path.c_str(), S_IRUSR | S_IWUSR | S_IXUSR) == -1 ||
      ::listen(fd, 64) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    ::unlink(path.c_str());
    throw DaemonError::io("cannot listen on " + path + ": " +
                          strerror(localErrno));
  }
  LOG(INFO) << "Listening on " << path;

  listenSockets[path] = fd;
  return set<int>({fd});
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = listenSockets.find(endpoint.name());
  if (it == listenSockets.end()) {
    STFATAL << "Not listening on " << endpoint.name();
  }
  return set<int>({it->second});
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);
  const string& path = endpoint.name();
  auto it = listenSockets.find(path);
  if (it == listenSockets.end()) {
    STERROR << "Tried to stop listening on " << path
            << " without listening first";
    return;
  }
  FATAL_FAIL(::close(it->second));
  listenSockets.erase(it);
  if (::unlink(path.c_str()) == -1 && GetErrno() != ENOENT) {
    LOG(WARNING) << "Could not remove socket file " << path << ": "
                 << strerror(GetErrno());
  }
}
}  // namespace ptykeep
