#include "ScrollbackBuffer.hpp"

namespace ptykeep {
ScrollbackBuffer::ScrollbackBuffer(size_t _capacity)
    : maxBytes(_capacity), head(0), length(0) {
  if (maxBytes == 0) {
    throw std::runtime_error("Scrollback capacity must be non-zero");
  }
  ring.resize(maxBytes);
}

void ScrollbackBuffer::push(const string &data) {
  if (data.empty()) return;
  lock_guard<recursive_mutex> guard(bufferMutex);

  const char *src = data.data();
  size_t count = data.size();
  if (count >= maxBytes) {
    // Only the tail of an oversized chunk survives
    src += count - maxBytes;
    count = maxBytes;
    head = 0;
    length = 0;
  }

  size_t tail = (head + length) % maxBytes;
  size_t firstPart = min(count, maxBytes - tail);
  memcpy(&ring[tail], src, firstPart);
  if (firstPart < count) {
    memcpy(&ring[0], src + firstPart, count - firstPart);
  }

  if (length + count > maxBytes) {
    size_t evicted = length + count - maxBytes;
    head = (head + evicted) % maxBytes;
    length = maxBytes;
  } else {
    length += count;
  }
}

string ScrollbackBuffer::contents() const {
  lock_guard<recursive_mutex> guard(bufferMutex);
  string s;
  s.reserve(length);
  size_t firstPart = min(length, maxBytes - head);
  s.append(&ring[head], firstPart);
  if (firstPart < length) {
    s.append(&ring[0], length - firstPart);
  }
  return s;
}

size_t ScrollbackBuffer::size() const {
  lock_guard<recursive_mutex> guard(bufferMutex);
  return length;
}

void ScrollbackBuffer::clear() {
  lock_guard<recursive_mutex> guard(bufferMutex);
  head = 0;
  length = 0;
}
}  // namespace ptykeep
