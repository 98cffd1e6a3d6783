#ifndef __PTYKEEP_SCROLLBACK_BUFFER__
#define __PTYKEEP_SCROLLBACK_BUFFER__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Fixed-capacity ring of the most recent raw PTY output bytes.
 *
 * Shared between a session and its output reader. When a push would exceed
 * the capacity the oldest bytes are discarded. All methods lock the buffer's
 * mutex; callers that need a read and another action to be atomic with
 * respect to pushes (the reader broadcasting a chunk, a client subscribing)
 * hold getMutex() around both.
 */
class ScrollbackBuffer {
 public:
  explicit ScrollbackBuffer(size_t _capacity);

  /** @brief Appends bytes, evicting the oldest ones past the capacity. */
  void push(const string &data);

  /** @brief Returns every retained byte, oldest first. */
  string contents() const;

  size_t size() const;

  size_t capacity() const { return maxBytes; }

  bool empty() const { return size() == 0; }

  void clear();

  recursive_mutex &getMutex() const { return bufferMutex; }

 protected:
  size_t maxBytes;
  vector<char> ring;
  // Index of the oldest retained byte
  size_t head;
  size_t length;
  mutable recursive_mutex bufferMutex;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_SCROLLBACK_BUFFER__
