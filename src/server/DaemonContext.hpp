#ifndef __PTYKEEP_DAEMON_CONTEXT__
#define __PTYKEEP_DAEMON_CONTEXT__

#include "DaemonConfig.hpp"
#include "Headers.hpp"
#include "PtyExitQueue.hpp"
#include "SessionManager.hpp"

namespace ptykeep {
/**
 * @brief State shared by every connection of one daemon instance.
 *
 * The SessionManager is only reachable through readLock()/writeLock():
 * queries share the lock, mutations take it exclusively.
 */
class DaemonContext {
 public:
  explicit DaemonContext(const DaemonConfig& _config);

  std::shared_lock<std::shared_mutex> readLock() {
    return std::shared_lock<std::shared_mutex>(sessionsMutex);
  }

  std::unique_lock<std::shared_mutex> writeLock() {
    return std::unique_lock<std::shared_mutex>(sessionsMutex);
  }

  /** @brief Caller must hold readLock() or writeLock(). */
  SessionManager& getSessionManager() { return *sessionManager; }

  const DaemonConfig& getConfig() const { return config; }

  /** @brief Applies PTY exits reported by output readers. */
  int processExitEvents();

  /** @brief Best exit code known for a session, or -1. */
  int exitCodeFor(const string& sessionId);

  void requestShutdown();

  bool isShuttingDown() const { return shuttingDown; }

 protected:
  DaemonConfig config;
  shared_ptr<PtyExitQueue> exitQueue;
  shared_mutex sessionsMutex;
  shared_ptr<SessionManager> sessionManager;
  atomic<bool> shuttingDown;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_DAEMON_CONTEXT__
