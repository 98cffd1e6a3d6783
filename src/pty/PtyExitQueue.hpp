#ifndef __PTYKEEP_PTY_EXIT_QUEUE__
#define __PTYKEEP_PTY_EXIT_QUEUE__

#include "Headers.hpp"

namespace ptykeep {
/** @brief Posted by an output reader when its PTY reaches EOF. */
struct PtyExitEvent {
  string sessionId;
  // Identifies the reader, so a late event cannot stop a newer session that
  // reused the id
  uint64_t readerId;
  optional<int> exitCode;
};

/**
 * @brief Thread-safe queue from the output readers to the session manager.
 */
class PtyExitQueue {
 public:
  void push(const PtyExitEvent& event) {
    lock_guard<mutex> guard(queueMutex);
    events.push_back(event);
  }

  vector<PtyExitEvent> drain() {
    lock_guard<mutex> guard(queueMutex);
    vector<PtyExitEvent> drained(events.begin(), events.end());
    events.clear();
    return drained;
  }

  bool empty() {
    lock_guard<mutex> guard(queueMutex);
    return events.empty();
  }

 protected:
  mutex queueMutex;
  deque<PtyExitEvent> events;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_PTY_EXIT_QUEUE__
