#include "DaemonContext.hpp"

namespace ptykeep {
DaemonContext::DaemonContext(const DaemonConfig& _config)
    : config(_config),
      exitQueue(new PtyExitQueue()),
      sessionManager(new SessionManager(_config, exitQueue)),
      shuttingDown(false) {}

int DaemonContext::processExitEvents() {
  if (exitQueue->empty()) {
    return 0;
  }
  auto lock = writeLock();
  return sessionManager->processExitEvents();
}

int DaemonContext::exitCodeFor(const string& sessionId) {
  auto lock = readLock();
  auto info = sessionManager->getSession(sessionId);
  if (info && info->exitCode) {
    return *info->exitCode;
  }
  return -1;
}

void DaemonContext::requestShutdown() {
  if (!shuttingDown.exchange(true)) {
    LOG(INFO) << "Shutdown requested";
  }
}
}  // namespace ptykeep
