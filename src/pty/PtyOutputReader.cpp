#include "PtyOutputReader.hpp"

#define READ_BUF_SIZE (4096)

namespace ptykeep {
namespace {
// How long the reader waits for the child to be reapable after EOF
const int EXIT_STATUS_TIMEOUT_MS = 1000;
}  // namespace

PtyOutputReader::PtyOutputReader(uint64_t _readerId, const string& _sessionId,
                                 int _readerFd,
                                 shared_ptr<ScrollbackBuffer> _scrollback,
                                 const BroadcastSender& _sender,
                                 shared_ptr<ChildProcess> _child,
                                 shared_ptr<PtyExitQueue> _exitQueue)
    : readerId(_readerId),
      sessionId(_sessionId),
      readerFd(_readerFd),
      scrollback(_scrollback),
      sender(_sender),
      child(_child),
      exitQueue(_exitQueue),
      stopRequested(false),
      finished(false) {}

PtyOutputReader::~PtyOutputReader() {
  stop();
  join();
  if (readerFd >= 0) {
    ::close(readerFd);
  }
}

void PtyOutputReader::start() {
  readerThread.reset(new thread(&PtyOutputReader::run, this));
}

void PtyOutputReader::stop() { stopRequested = true; }

void PtyOutputReader::join() {
  if (readerThread && readerThread->joinable()) {
    readerThread->join();
  }
}

void PtyOutputReader::run() {
  el::Helpers::setThreadName("reader-" + sessionId);
  char buf[READ_BUF_SIZE];
  bool reachedEof = false;

  while (!stopRequested) {
    if (!waitOnSocketData(readerFd, 10000)) {
      continue;
    }
    ssize_t rc = ::read(readerFd, buf, READ_BUF_SIZE);
    if (rc > 0) {
      string chunk(buf, rc);
      lock_guard<recursive_mutex> guard(scrollback->getMutex());
      scrollback->push(chunk);
      sender->send(chunk);
      VLOG(4) << "Read " << rc << " bytes from " << sessionId;
      continue;
    }
    auto readErrno = GetErrno();
    if (rc < 0 && (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
                   readErrno == EINTR)) {
      continue;
    }
    // Linux reports EIO once the slave side is closed
    if (rc < 0 && readErrno != EIO) {
      LOG(WARNING) << "Pty read error for " << sessionId << ": "
                   << strerror(readErrno);
    }
    reachedEof = true;
    break;
  }

  if (reachedEof) {
    PtyExitEvent event;
    event.sessionId = sessionId;
    event.readerId = readerId;
    event.exitCode =
        child->waitFor(std::chrono::milliseconds(EXIT_STATUS_TIMEOUT_MS));
    LOG(INFO) << "Pty for " << sessionId << " reached EOF, exit code "
              << (event.exitCode ? to_string(*event.exitCode) : "unknown");
    exitQueue->push(event);
  }
  sender.reset();
  finished = true;
}
}  // namespace ptykeep
