#ifndef __PTYKEEP_OUTPUT_FORWARDER__
#define __PTYKEEP_OUTPUT_FORWARDER__

#include "BroadcastChannel.hpp"
#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Relays one session's output channel to a connection on its own
 * thread.
 *
 * The handlers run on the forwarder thread. If one throws, forwarding stops.
 * onClosed runs when the channel closes, but not after stop().
 */
class OutputForwarder {
 public:
  OutputForwarder(const string& _sessionId, BroadcastReceiver _receiver,
                  function<void(const string&)> _onData,
                  function<void(uint64_t)> _onDropped,
                  function<void()> _onClosed);
  virtual ~OutputForwarder();

  void start();

  /** @brief Asks the thread to exit and waits for it. */
  void stop();

  bool isFinished() const { return finished; }

  const string& getSessionId() const { return sessionId; }

 protected:
  void run();

  string sessionId;
  BroadcastReceiver receiver;
  function<void(const string&)> onData;
  function<void(uint64_t)> onDropped;
  function<void()> onClosed;
  atomic<bool> stopRequested;
  atomic<bool> finished;
  std::thread forwarderThread;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_OUTPUT_FORWARDER__
