#ifndef __PTYKEEP_MANAGED_PTY__
#define __PTYKEEP_MANAGED_PTY__

#include "ChildProcess.hpp"
#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Master side of one pseudo-terminal plus the child attached to it.
 *
 * The write handle is duplicated from the master once, at construction, and
 * every write goes through it under `writerMutex` so concurrent writers never
 * interleave partial writes.
 */
class ManagedPty {
 public:
  ManagedPty(const string& _sessionId, int _masterFd,
             shared_ptr<ChildProcess> _child, uint16_t _rows, uint16_t _cols);
  ~ManagedPty();

  /** @brief Writes every byte of `data` to the child's stdin. */
  void writeStdin(const string& data);

  /** @brief Issues TIOCSWINSZ and updates the cached size. */
  void resize(uint16_t rows, uint16_t cols);

  /**
   * @brief Returns an independent descriptor for reading output. The caller
   * owns (and closes) it.
   */
  int tryCloneReader();

  void kill();

  /** @brief Blocks until the child exits, for controlled teardown. */
  optional<int> wait();

  pid_t childProcessId() const { return child->getPid(); }

  shared_ptr<ChildProcess> getChild() { return child; }

  const string& getSessionId() const { return sessionId; }

  pair<uint16_t, uint16_t> getSize();

 protected:
  string sessionId;
  int masterFd;
  int writerFd;
  mutex writerMutex;
  shared_ptr<ChildProcess> child;
  mutex sizeMutex;
  uint16_t rows;
  uint16_t cols;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_MANAGED_PTY__
