#include "BroadcastChannel.hpp"

namespace ptykeep {
BroadcastState::BroadcastState(size_t _capacity)
    : capacity(_capacity),
      nextSeq(0),
      totalBytes(0),
      senderCount(0),
      receiverCount(0),
      closed(false) {
  if (capacity == 0) {
    throw std::runtime_error("Broadcast channel capacity must be non-zero");
  }
}

BroadcastSender::BroadcastSender(size_t capacity)
    : state(make_shared<BroadcastState>(capacity)) {
  state->senderCount = 1;
}

BroadcastSender::BroadcastSender(const BroadcastSender& other)
    : state(other.state) {
  if (state) {
    lock_guard<mutex> guard(state->stateMutex);
    state->senderCount++;
  }
}

BroadcastSender::BroadcastSender(BroadcastSender&& other) noexcept
    : state(std::move(other.state)) {
  other.state.reset();
}

BroadcastSender& BroadcastSender::operator=(const BroadcastSender& other) {
  if (this != &other) {
    release();
    state = other.state;
    if (state) {
      lock_guard<mutex> guard(state->stateMutex);
      state->senderCount++;
    }
  }
  return *this;
}

BroadcastSender& BroadcastSender::operator=(BroadcastSender&& other) noexcept {
  if (this != &other) {
    release();
    state = std::move(other.state);
    other.state.reset();
  }
  return *this;
}

BroadcastSender::~BroadcastSender() { release(); }

void BroadcastSender::release() {
  if (!state) {
    return;
  }
  {
    lock_guard<mutex> guard(state->stateMutex);
    state->senderCount--;
    if (state->senderCount == 0) {
      state->closed = true;
    }
  }
  state->dataReady.notify_all();
  state.reset();
}

int BroadcastSender::send(const string& data) {
  if (!state) {
    throw std::runtime_error("send() on a moved-from BroadcastSender");
  }
  int receivers;
  {
    lock_guard<mutex> guard(state->stateMutex);
    BroadcastState::Slot slot;
    slot.seq = state->nextSeq++;
    slot.byteOffset = state->totalBytes;
    slot.data = data;
    state->totalBytes += data.size();
    state->ring.push_back(std::move(slot));
    while (state->ring.size() > state->capacity) {
      state->ring.pop_front();
    }
    receivers = state->receiverCount;
  }
  state->dataReady.notify_all();
  return receivers;
}

BroadcastReceiver BroadcastSender::subscribe() const {
  if (!state) {
    throw std::runtime_error("subscribe() on a moved-from BroadcastSender");
  }
  lock_guard<mutex> guard(state->stateMutex);
  state->receiverCount++;
  return BroadcastReceiver(state, state->nextSeq, state->totalBytes);
}

int BroadcastSender::getReceiverCount() const {
  if (!state) {
    return 0;
  }
  lock_guard<mutex> guard(state->stateMutex);
  return state->receiverCount;
}

BroadcastReceiver::BroadcastReceiver(shared_ptr<BroadcastState> _state,
                                     uint64_t _nextSeq,
                                     uint64_t _nextByteOffset)
    : state(_state), nextSeq(_nextSeq), nextByteOffset(_nextByteOffset) {}

BroadcastReceiver::BroadcastReceiver(BroadcastReceiver&& other) noexcept
    : state(std::move(other.state)),
      nextSeq(other.nextSeq),
      nextByteOffset(other.nextByteOffset) {
  other.state.reset();
}

BroadcastReceiver& BroadcastReceiver::operator=(
    BroadcastReceiver&& other) noexcept {
  if (this != &other) {
    if (state) {
      lock_guard<mutex> guard(state->stateMutex);
      state->receiverCount--;
    }
    state = std::move(other.state);
    other.state.reset();
    nextSeq = other.nextSeq;
    nextByteOffset = other.nextByteOffset;
  }
  return *this;
}

BroadcastReceiver::~BroadcastReceiver() {
  if (state) {
    lock_guard<mutex> guard(state->stateMutex);
    state->receiverCount--;
  }
}

bool BroadcastReceiver::readyLocked() const {
  return nextSeq < state->nextSeq || state->closed;
}

RecvResult BroadcastReceiver::takeLocked() {
  RecvResult result;
  if (nextSeq < state->nextSeq) {
    const auto& oldest = state->ring.front();
    if (nextSeq < oldest.seq) {
      result.status = RecvStatus::Lagged;
      result.skippedChunks = oldest.seq - nextSeq;
      result.skippedBytes = oldest.byteOffset - nextByteOffset;
      nextSeq = oldest.seq;
      nextByteOffset = oldest.byteOffset;
      return result;
    }
    const auto& slot = state->ring[nextSeq - oldest.seq];
    result.status = RecvStatus::Data;
    result.data = slot.data;
    nextSeq++;
    nextByteOffset += slot.data.size();
    return result;
  }
  result.status = state->closed ? RecvStatus::Closed : RecvStatus::Timeout;
  return result;
}

RecvResult BroadcastReceiver::recv(std::chrono::milliseconds timeout) {
  if (!state) {
    RecvResult result;
    result.status = RecvStatus::Closed;
    return result;
  }
  unique_lock<mutex> guard(state->stateMutex);
  state->dataReady.wait_for(guard, timeout, [this] { return readyLocked(); });
  return takeLocked();
}

RecvResult BroadcastReceiver::tryRecv() {
  return recv(std::chrono::milliseconds(0));
}
}  // namespace ptykeep
