#include "ManagedPty.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
namespace {
// A write gives up when the child has not drained its input for this long
const int STDIN_STALL_TIMEOUT_MS = 2000;
}  // namespace

ManagedPty::ManagedPty(const string& _sessionId, int _masterFd,
                       shared_ptr<ChildProcess> _child, uint16_t _rows,
                       uint16_t _cols)
    : sessionId(_sessionId),
      masterFd(_masterFd),
      writerFd(-1),
      child(_child),
      rows(_rows),
      cols(_cols) {
  writerFd = ::fcntl(masterFd, F_DUPFD_CLOEXEC, 0);
  if (writerFd == -1) {
    auto localErrno = GetErrno();
    ::close(masterFd);
    throw DaemonError::ptyError("failed to take pty writer: " +
                                string(strerror(localErrno)));
  }
  // Shared by every descriptor of the master, so a child that stops reading
  // never blocks the daemon
  int opts = ::fcntl(writerFd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(::fcntl(writerFd, F_SETFL, opts | O_NONBLOCK));
}

ManagedPty::~ManagedPty() {
  if (writerFd >= 0) {
    ::close(writerFd);
  }
  if (masterFd >= 0) {
    ::close(masterFd);
  }
}

void ManagedPty::writeStdin(const string& data) {
  lock_guard<mutex> guard(writerMutex);
  size_t bytesWritten = 0;
  while (bytesWritten < data.size()) {
    ssize_t rc = ::write(writerFd, data.data() + bytesWritten,
                         data.size() - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        pollfd pfd;
        pfd.fd = writerFd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int n = ::poll(&pfd, 1, STDIN_STALL_TIMEOUT_MS);
        if (n == 0) {
          throw DaemonError::ptyError(sessionId + " is not reading its input");
        }
        continue;
      }
      throw DaemonError::ptyError("write to " + sessionId +
                                  " failed: " + strerror(localErrno));
    }
    if (rc == 0) {
      throw DaemonError::ptyError("write to " + sessionId + " made no progress");
    }
    bytesWritten += rc;
  }
  VLOG(4) << "Wrote " << bytesWritten << " bytes to " << sessionId;
}

void ManagedPty::resize(uint16_t _rows, uint16_t _cols) {
  winsize ws;
  memset(&ws, 0, sizeof(ws));
  ws.ws_row = _rows;
  ws.ws_col = _cols;
  if (::ioctl(masterFd, TIOCSWINSZ, &ws) == -1) {
    throw DaemonError::ptyError("resize of " + sessionId +
                                " failed: " + strerror(GetErrno()));
  }
  lock_guard<mutex> guard(sizeMutex);
  rows = _rows;
  cols = _cols;
}

int ManagedPty::tryCloneReader() {
  int fd = ::fcntl(masterFd, F_DUPFD_CLOEXEC, 0);
  if (fd == -1) {
    throw DaemonError::ptyError("failed to clone pty reader: " +
                                string(strerror(GetErrno())));
  }
  return fd;
}

void ManagedPty::kill() { child->kill(SIGKILL); }

optional<int> ManagedPty::wait() { return child->wait(); }

pair<uint16_t, uint16_t> ManagedPty::getSize() {
  lock_guard<mutex> guard(sizeMutex);
  return make_pair(rows, cols);
}
}  // namespace ptykeep
