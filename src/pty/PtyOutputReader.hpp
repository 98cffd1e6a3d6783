#ifndef __PTYKEEP_PTY_OUTPUT_READER__
#define __PTYKEEP_PTY_OUTPUT_READER__

#include "BroadcastChannel.hpp"
#include "ChildProcess.hpp"
#include "Headers.hpp"
#include "PtyExitQueue.hpp"
#include "ScrollbackBuffer.hpp"

namespace ptykeep {
/**
 * @brief Background thread that pumps one PTY's output.
 *
 * Each chunk is appended to the scrollback and broadcast while the scrollback
 * lock is held, so a client that snapshots the scrollback and subscribes under
 * the same lock sees neither a gap nor a duplicate. On EOF the reader collects
 * the exit code, posts a PtyExitEvent and stops for good. The reader holds a
 * sender on the session's channel; the channel closes once both the reader
 * and the session have let go of theirs.
 */
class PtyOutputReader {
 public:
  PtyOutputReader(uint64_t _readerId, const string& _sessionId, int _readerFd,
                  shared_ptr<ScrollbackBuffer> _scrollback,
                  const BroadcastSender& _sender,
                  shared_ptr<ChildProcess> _child,
                  shared_ptr<PtyExitQueue> _exitQueue);
  ~PtyOutputReader();

  void start();

  /**
   * @brief Asks the thread to stop without posting an exit event. Used when
   * the session was stopped or destroyed on purpose.
   */
  void stop();

  void join();

  bool isFinished() const { return finished; }

  uint64_t getId() const { return readerId; }

  const string& getSessionId() const { return sessionId; }

 protected:
  void run();

  uint64_t readerId;
  string sessionId;
  int readerFd;
  shared_ptr<ScrollbackBuffer> scrollback;
  optional<BroadcastSender> sender;
  shared_ptr<ChildProcess> child;
  shared_ptr<PtyExitQueue> exitQueue;
  atomic<bool> stopRequested;
  atomic<bool> finished;
  unique_ptr<thread> readerThread;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_PTY_OUTPUT_READER__
