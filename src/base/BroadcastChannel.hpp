#ifndef __PTYKEEP_BROADCAST_CHANNEL__
#define __PTYKEEP_BROADCAST_CHANNEL__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Shared state of a bounded, multi-subscriber channel of byte chunks.
 *
 * The channel retains the last `capacity` chunks. Senders never block: when
 * the ring is full the oldest chunk is evicted, and a receiver that had not
 * read it yet observes a lag on its next receive. The channel closes when the
 * last BroadcastSender referencing it is destroyed.
 */
class BroadcastState {
 public:
  explicit BroadcastState(size_t _capacity);

  struct Slot {
    uint64_t seq;
    // Total bytes sent on the channel before this chunk
    uint64_t byteOffset;
    string data;
  };

  size_t getCapacity() const { return capacity; }

 protected:
  friend class BroadcastSender;
  friend class BroadcastReceiver;

  size_t capacity;
  mutex stateMutex;
  condition_variable dataReady;
  deque<Slot> ring;
  uint64_t nextSeq;
  uint64_t totalBytes;
  int senderCount;
  int receiverCount;
  bool closed;
};

class BroadcastReceiver;

/**
 * @brief Sending half of a broadcast channel. Copies share the channel.
 */
class BroadcastSender {
 public:
  /** @brief Creates a new channel retaining at most `capacity` chunks. */
  explicit BroadcastSender(size_t capacity);
  BroadcastSender(const BroadcastSender& other);
  BroadcastSender(BroadcastSender&& other) noexcept;
  BroadcastSender& operator=(const BroadcastSender& other);
  BroadcastSender& operator=(BroadcastSender&& other) noexcept;
  ~BroadcastSender();

  /**
   * @brief Appends a chunk for every current receiver.
   * @return Number of receivers alive at the time of the send.
   */
  int send(const string& data);

  /**
   * @brief Creates a receiver that sees every chunk sent after this call.
   */
  BroadcastReceiver subscribe() const;

  int getReceiverCount() const;

 protected:
  void release();

  shared_ptr<BroadcastState> state;
};

enum class RecvStatus {
  Data,
  Lagged,
  Closed,
  Timeout,
};

struct RecvResult {
  RecvStatus status;
  // Set when status is Data
  string data;
  // Set when status is Lagged
  uint64_t skippedChunks = 0;
  uint64_t skippedBytes = 0;
};

/**
 * @brief Receiving half of a broadcast channel with its own read cursor.
 */
class BroadcastReceiver {
 public:
  BroadcastReceiver(shared_ptr<BroadcastState> _state, uint64_t _nextSeq,
                    uint64_t _nextByteOffset);
  BroadcastReceiver(const BroadcastReceiver& other) = delete;
  BroadcastReceiver& operator=(const BroadcastReceiver& other) = delete;
  BroadcastReceiver(BroadcastReceiver&& other) noexcept;
  BroadcastReceiver& operator=(BroadcastReceiver&& other) noexcept;
  ~BroadcastReceiver();

  /**
   * @brief Waits up to `timeout` for the next chunk.
   *
   * Returns Lagged (once) if chunks were evicted before this receiver read
   * them; the cursor then moves to the oldest retained chunk. Returns Closed
   * only after every retained chunk has been delivered.
   */
  RecvResult recv(std::chrono::milliseconds timeout);

  /** @brief Same as recv() but never waits. */
  RecvResult tryRecv();

 protected:
  // Must be called with the state mutex held
  bool readyLocked() const;
  RecvResult takeLocked();

  shared_ptr<BroadcastState> state;
  uint64_t nextSeq;
  uint64_t nextByteOffset;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_BROADCAST_CHANNEL__
