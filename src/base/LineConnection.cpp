#include "LineConnection.hpp"

namespace ptykeep {
LineConnection::LineConnection(shared_ptr<SocketHandler> _socketHandler,
                               int _socketFd)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      peerClosed(false),
      writeFailed(false),
      closed(false) {}

LineConnection::~LineConnection() { close(); }

bool LineConnection::takeBufferedLine(string* line) {
  size_t newline = partialLine.find('\n');
  if (newline == string::npos) {
    return false;
  }
  *line = partialLine.substr(0, newline);
  partialLine.erase(0, newline + 1);
  if (!line->empty() && line->back() == '\r') {
    line->pop_back();
  }
  return true;
}

int LineConnection::readLine(string* line, int64_t timeoutUsec) {
  if (takeBufferedLine(line)) {
    return 1;
  }
  if (peerClosed) {
    if (!partialLine.empty()) {
      // The last line was not terminated
      *line = partialLine;
      partialLine.clear();
      return 1;
    }
    return -1;
  }
  if (!socketHandler->waitForData(socketFd, timeoutUsec)) {
    return 0;
  }

  char buf[64 * 1024];
  ssize_t bytesRead = socketHandler->read(socketFd, buf, sizeof(buf));
  if (bytesRead < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return 0;
    }
    VLOG(1) << "Connection " << socketFd
            << " read failed: " << strerror(localErrno);
    peerClosed = true;
    partialLine.clear();
    return -1;
  }
  if (bytesRead == 0) {
    VLOG(1) << "Connection " << socketFd << " closed by peer";
    peerClosed = true;
    return readLine(line, 0);
  }
  partialLine.append(buf, bytesRead);
  if (takeBufferedLine(line)) {
    return 1;
  }
  if (partialLine.length() > MAX_LINE_LENGTH) {
    LOG(WARNING) << "Connection " << socketFd << " sent a line longer than "
                 << MAX_LINE_LENGTH << " bytes, dropping it";
    peerClosed = true;
    partialLine.clear();
    return -1;
  }
  return 0;
}

void LineConnection::writeLine(const string& line) {
  lock_guard<mutex> guard(writeMutex);
  if (writeFailed) {
    throw std::runtime_error("Connection is no longer writable");
  }
  string s = line;
  s.push_back('\n');
  try {
    socketHandler->writeAll(socketFd, s.c_str(), s.length(),
                            WRITE_STALL_TIMEOUT_SECS);
  } catch (const std::runtime_error&) {
    writeFailed = true;
    throw;
  }
}

void LineConnection::close() {
  lock_guard<mutex> guard(closeMutex);
  if (closed) {
    return;
  }
  closed = true;
  {
    // Wait for an in-flight write to finish before the fd goes away
    lock_guard<mutex> writeGuard(writeMutex);
    writeFailed = true;
  }
  socketHandler->close(socketFd);
}
}  // namespace ptykeep
