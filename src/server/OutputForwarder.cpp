#include "OutputForwarder.hpp"

namespace ptykeep {
OutputForwarder::OutputForwarder(const string& _sessionId,
                                 BroadcastReceiver _receiver,
                                 function<void(const string&)> _onData,
                                 function<void(uint64_t)> _onDropped,
                                 function<void()> _onClosed)
    : sessionId(_sessionId),
      receiver(std::move(_receiver)),
      onData(_onData),
      onDropped(_onDropped),
      onClosed(_onClosed),
      stopRequested(false),
      finished(false) {}

OutputForwarder::~OutputForwarder() { stop(); }

void OutputForwarder::start() {
  forwarderThread = std::thread(&OutputForwarder::run, this);
}

void OutputForwarder::stop() {
  stopRequested = true;
  if (forwarderThread.joinable()) {
    if (forwarderThread.get_id() == std::this_thread::get_id()) {
      forwarderThread.detach();
    } else {
      forwarderThread.join();
    }
  }
}

void OutputForwarder::run() {
  try {
    while (!stopRequested) {
      RecvResult result = receiver.recv(std::chrono::milliseconds(10));
      switch (result.status) {
        case RecvStatus::Timeout:
          break;
        case RecvStatus::Data:
          VLOG(4) << "Forwarding " << result.data.length() << " bytes of "
                  << sessionId;
          onData(result.data);
          break;
        case RecvStatus::Lagged:
          LOG(WARNING) << "Output of " << sessionId << " lagged, dropped "
                       << result.skippedChunks << " chunks ("
                       << result.skippedBytes << " bytes)";
          onDropped(result.skippedBytes);
          break;
        case RecvStatus::Closed:
          VLOG(1) << "Output channel of " << sessionId << " closed";
          if (!stopRequested) {
            onClosed();
          }
          finished = true;
          return;
      }
    }
  } catch (const std::exception& e) {
    VLOG(1) << "Stopped forwarding " << sessionId << ": " << e.what();
  }
  finished = true;
}
}  // namespace ptykeep
